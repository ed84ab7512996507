#include "llmshield/guard/options.hpp"

namespace llmshield::guard {

const ThresholdTable &default_thresholds() {
  static const ThresholdTable table = {
      {"toxicity", 0.7},
      {"pii_risk", 0.9},
      {"prompt_injection", 0.8},
      {"jailbreak", 0.85},
  };
  return table;
}

GuardOptions options_from_config(const config::Config &config) {
  GuardOptions options;
  options.validators = config.engine.validators;
  options.thresholds = config.thresholds;
  options.cache_enabled = config.engine.cache_enabled;
  options.cache_size = config.engine.cache_size;
  options.metrics_enabled = config.engine.metrics_enabled;
  options.parallel_checks = config.engine.parallel_checks;
  return options;
}

} // namespace llmshield::guard
