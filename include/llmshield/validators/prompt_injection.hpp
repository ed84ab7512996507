#pragma once

#include "llmshield/validators/validator.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace llmshield::validators {

struct InjectionDetection {
  // Technique family, "known_jailbreak" or "suspicious_tokens".
  std::string technique;
  std::string evidence;
  double risk_score = 0.0;
};

struct InjectionAnalysis {
  double score = 0.0;
  // Order of first detection.
  std::vector<std::string> techniques_detected;
  std::size_t total_patterns_matched = 0;
  std::vector<InjectionDetection> detections;
  bool known_jailbreak = false;
  std::optional<std::string> reason;
};

struct JailbreakVerdict {
  bool is_jailbreak = false;
  double score = 0.0;
  std::string technique = "unknown";
};

class PromptInjectionValidator final : public IValidator {
public:
  static constexpr double kDefaultJailbreakThreshold = 0.8;

  PromptInjectionValidator();

  [[nodiscard]] std::string_view name() const override { return "prompt_injection"; }
  [[nodiscard]] std::string_view threshold_key() const override { return "prompt_injection"; }
  [[nodiscard]] common::Result<ValidationResult> validate(const std::string &text) const override;

  [[nodiscard]] common::Result<InjectionAnalysis> analyze(const std::string &text) const;
  [[nodiscard]] common::Result<JailbreakVerdict>
  detect_jailbreak(const std::string &text, double threshold = kDefaultJailbreakThreshold) const;
  [[nodiscard]] common::Result<std::string> explain(const std::string &text) const;
  [[nodiscard]] common::Result<std::vector<std::string>> techniques(const std::string &text) const;

private:
  struct Technique {
    std::string name;
    double risk_score = 0.0;
    std::string description;
    std::vector<std::pair<std::regex, std::string>> patterns;
  };

  std::vector<Technique> techniques_;
  std::vector<std::string> known_jailbreaks_;
  std::vector<std::string> role_markers_;
  std::regex dan_style_;
  std::regex unrestricted_role_;
  std::regex override_all_;
};

} // namespace llmshield::validators
