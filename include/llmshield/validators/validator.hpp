#pragma once

#include "llmshield/common/result.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace llmshield::validators {

using Attributes = std::map<std::string, std::string>;

struct ValidationResult {
  double score = 0.0;
  std::optional<std::string> reason;
  Attributes attributes;
  // Keys whose attribute value is compact JSON text rather than a plain string.
  std::set<std::string> json_attributes;

  void set_json_attribute(const std::string &key, std::string json) {
    attributes[key] = std::move(json);
    json_attributes.insert(key);
  }
};

class IValidator {
public:
  virtual ~IValidator() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  // Key in the threshold table this validator's score is compared against.
  [[nodiscard]] virtual std::string_view threshold_key() const = 0;
  // Deterministic for identical input and safe to call concurrently. Internal failures are
  // reported as ErrorCode::Validator; nothing is thrown across this boundary.
  [[nodiscard]] virtual common::Result<ValidationResult> validate(const std::string &text) const = 0;
};

[[nodiscard]] std::string format_score(double value);

} // namespace llmshield::validators
