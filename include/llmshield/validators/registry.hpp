#pragma once

#include "llmshield/validators/validator.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmshield::validators {

class ValidatorRegistry {
public:
  ValidatorRegistry() = default;

  void register_validator(std::unique_ptr<IValidator> validator);
  [[nodiscard]] IValidator *get_validator(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const;
  // Registration order.
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] std::size_t size() const { return validators_.size(); }

  // toxicity, pii and prompt_injection.
  [[nodiscard]] static ValidatorRegistry create_default();

private:
  std::vector<std::unique_ptr<IValidator>> validators_;
  std::unordered_map<std::string, IValidator *> by_name_;
};

} // namespace llmshield::validators
