#pragma once

#include "llmshield/validators/validator.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace llmshield::validators {

struct PiiPatternEntry {
  std::string type;
  std::regex regex;
  double risk_score = 0.0;
  std::string redact_label;
  std::string description;
  // Entry only applies when one of these appears in the text (case-insensitive).
  std::vector<std::string> context_required;
  std::function<bool(const std::string &)> checksum;
};

struct MatchSpan {
  std::size_t start = 0;
  std::size_t end = 0;
  std::string label;
};

struct PiiFinding {
  std::string type;
  std::string masked_value;
  std::size_t start = 0;
  std::size_t end = 0;
  double risk_score = 0.0;
  std::string description;
};

struct PiiAnalysis {
  double risk_score = 0.0;
  // First ten findings in table order.
  std::vector<PiiFinding> findings;
  // Type -> match count in table order, "potential_names" last.
  std::vector<std::pair<std::string, std::size_t>> counts;
  std::size_t total_items = 0;
  double name_score = 0.0;
  std::optional<std::string> reason;
};

class PiiValidator final : public IValidator {
public:
  using LabelOverrides = std::map<std::string, std::string>;

  PiiValidator();

  [[nodiscard]] std::string_view name() const override { return "pii"; }
  [[nodiscard]] std::string_view threshold_key() const override { return "pii_risk"; }
  [[nodiscard]] common::Result<ValidationResult> validate(const std::string &text) const override;

  [[nodiscard]] common::Result<PiiAnalysis> analyze(const std::string &text) const;
  [[nodiscard]] common::Result<std::string> redact(const std::string &text,
                                                   const LabelOverrides &custom_labels = {}) const;
  [[nodiscard]] common::Result<std::vector<MatchSpan>>
  find_spans(const std::string &text, const LabelOverrides &custom_labels = {}) const;
  [[nodiscard]] common::Result<std::string> generate_report(const std::string &text) const;
  [[nodiscard]] common::Result<std::vector<std::string>> pii_types(const std::string &text) const;
  // ssn, credit_card, passport or medical_record present.
  [[nodiscard]] common::Result<bool> has_high_risk_pii(const std::string &text) const;
  [[nodiscard]] common::Result<double> name_likelihood(const std::string &text) const;

  [[nodiscard]] const std::vector<PiiPatternEntry> &entries() const { return entries_; }

  [[nodiscard]] static bool luhn_valid(const std::string &number);
  [[nodiscard]] static std::string mask_value(const std::string &value);

private:
  [[nodiscard]] double score_names(const std::string &text) const;
  [[nodiscard]] static bool context_present(const PiiPatternEntry &entry,
                                            const std::string &lowered_text);

  std::vector<PiiPatternEntry> entries_;
  std::vector<std::regex> name_indicators_;
  std::vector<std::string> name_context_words_;
  std::regex name_intro_;
};

} // namespace llmshield::validators
