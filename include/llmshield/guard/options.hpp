#pragma once

#include "llmshield/config/schema.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace llmshield::guard {

using ThresholdTable = std::map<std::string, double>;

// toxicity 0.7, pii_risk 0.9, prompt_injection 0.8, jailbreak 0.85.
[[nodiscard]] const ThresholdTable &default_thresholds();
// Threshold used when a validator's key is missing from the table.
inline constexpr double kFallbackThreshold = 0.5;

struct GuardOptions {
  std::vector<std::string> validators = {"toxicity", "pii", "prompt_injection"};
  // Merged over default_thresholds().
  ThresholdTable thresholds;
  bool cache_enabled = true;
  std::size_t cache_size = 10'000;
  bool metrics_enabled = true;
  bool parallel_checks = true;
};

[[nodiscard]] GuardOptions options_from_config(const config::Config &config);

} // namespace llmshield::guard
