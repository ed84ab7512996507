#pragma once

#include "llmshield/validators/validator.hpp"

#include <map>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace llmshield::validators {

struct ToxicityMatch {
  std::string category;
  double score = 0.0;
  std::string pattern;
};

struct ToxicityAnalysis {
  double score = 0.0;
  // Mean of the per-category maxima.
  double base_score = 0.0;
  double context_modifier = 0.0;
  double intensity_modifier = 0.0;
  // Only categories with at least one match.
  std::map<std::string, double> category_maxima;
  std::vector<ToxicityMatch> matches;
  std::optional<std::string> reason;
};

class ToxicityValidator final : public IValidator {
public:
  ToxicityValidator();

  [[nodiscard]] std::string_view name() const override { return "toxicity"; }
  [[nodiscard]] std::string_view threshold_key() const override { return "toxicity"; }
  [[nodiscard]] common::Result<ValidationResult> validate(const std::string &text) const override;

  [[nodiscard]] common::Result<ToxicityAnalysis> analyze(const std::string &text) const;
  [[nodiscard]] common::Result<std::string> explain(const std::string &text) const;
  // Every category, 0 when nothing matched.
  [[nodiscard]] common::Result<std::map<std::string, double>>
  category_scores(const std::string &text) const;

  // Collapses whitespace, drops zero-width characters and spaces out punctuation.
  [[nodiscard]] static std::string preprocess(const std::string &text);

private:
  struct WeightedPattern {
    std::regex regex;
    std::string source;
    double score = 0.0;
  };

  struct Category {
    std::string name;
    double weight = 1.0;
    std::vector<WeightedPattern> patterns;
  };

  struct Modifier {
    std::regex regex;
    double delta = 0.0;
  };

  std::vector<Category> categories_;
  std::vector<Modifier> context_modifiers_;
  std::vector<Modifier> intensity_modifiers_;
  std::set<std::string> academic_words_;
  std::set<std::string> fictional_words_;
};

} // namespace llmshield::validators
