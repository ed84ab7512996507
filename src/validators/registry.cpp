#include "llmshield/validators/registry.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/validators/pii.hpp"
#include "llmshield/validators/prompt_injection.hpp"
#include "llmshield/validators/toxicity.hpp"

namespace llmshield::validators {

void ValidatorRegistry::register_validator(std::unique_ptr<IValidator> validator) {
  if (validator == nullptr) {
    return;
  }
  const std::string key = common::to_lower(std::string(validator->name()));
  IValidator *raw = validator.get();
  if (const auto it = by_name_.find(key); it != by_name_.end()) {
    // Re-registration replaces the earlier validator in place.
    for (auto &existing : validators_) {
      if (existing.get() == it->second) {
        existing = std::move(validator);
        break;
      }
    }
    it->second = raw;
    return;
  }
  by_name_[key] = raw;
  validators_.push_back(std::move(validator));
}

IValidator *ValidatorRegistry::get_validator(const std::string_view name) const {
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ValidatorRegistry::contains(const std::string_view name) const {
  return get_validator(name) != nullptr;
}

std::vector<std::string> ValidatorRegistry::names() const {
  std::vector<std::string> out;
  out.reserve(validators_.size());
  for (const auto &validator : validators_) {
    out.emplace_back(validator->name());
  }
  return out;
}

ValidatorRegistry ValidatorRegistry::create_default() {
  ValidatorRegistry registry;
  registry.register_validator(std::make_unique<ToxicityValidator>());
  registry.register_validator(std::make_unique<PiiValidator>());
  registry.register_validator(std::make_unique<PromptInjectionValidator>());
  return registry;
}

} // namespace llmshield::validators
