#pragma once

#include "llmshield/rules/rule_engine.hpp"
#include "llmshield/validators/validator.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace llmshield::guard {

struct SafetyResult {
  bool is_safe = true;
  // "; "-joined contributions; unset when the verdict is safe.
  std::optional<std::string> reason;
  // Only filled for detailed checks.
  std::map<std::string, double> scores;
  std::map<std::string, validators::ValidationResult> details;
  double latency_ms = 0.0;

  std::vector<std::string> triggered_checks;
  std::vector<rules::TriggeredRule> triggered_rules;
  std::vector<std::string> flags;
  std::optional<std::string> allowed_by;
  std::optional<std::string> redacted_text;
};

[[nodiscard]] std::string to_json(const SafetyResult &result);

} // namespace llmshield::guard
