#pragma once

#include "llmshield/guard/safety_result.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace llmshield::guard {

struct MetricsSnapshot {
  std::uint64_t total_checks = 0;
  std::uint64_t blocked = 0;
  double block_rate = 0.0;
  double avg_latency_ms = 0.0;
  std::map<std::string, std::uint64_t> check_counts;
  std::map<std::string, std::uint64_t> block_counts;
  std::size_t cache_size = 0;
  std::uint64_t cache_hits = 0;
};

// Block counts for verdicts decided by a custom block rule are kept under this key.
inline constexpr const char *kCustomRulesMetricKey = "custom_rules";

class MetricsAccumulator {
public:
  void record(const std::vector<std::string> &checks, const SafetyResult &result,
              double latency_ms, bool cache_hit);
  [[nodiscard]] MetricsSnapshot snapshot() const;
  void reset();

private:
  mutable std::mutex mutex_;
  std::uint64_t total_checks_ = 0;
  std::uint64_t blocked_ = 0;
  double total_latency_ms_ = 0.0;
  std::uint64_t cache_hits_ = 0;
  std::map<std::string, std::uint64_t> check_counts_;
  std::map<std::string, std::uint64_t> block_counts_;
};

[[nodiscard]] std::string to_json(const MetricsSnapshot &snapshot);

} // namespace llmshield::guard
