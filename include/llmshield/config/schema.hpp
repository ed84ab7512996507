#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace llmshield::config {

struct EngineConfig {
  std::vector<std::string> validators = {"toxicity", "pii", "prompt_injection"};
  bool cache_enabled = true;
  std::size_t cache_size = 10'000;
  bool metrics_enabled = true;
  bool parallel_checks = true;
};

struct RulesConfig {
  std::string file = "~/.llmshield/rules.json";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  EngineConfig engine;
  // Overrides merged on top of the built-in threshold table.
  std::map<std::string, double> thresholds;
  RulesConfig rules;
  ObservabilityConfig observability;
};

} // namespace llmshield::config
