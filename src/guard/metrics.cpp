#include "llmshield/guard/metrics.hpp"

#include "llmshield/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace llmshield::guard {

namespace {

void write_counts(std::ostringstream &out, const std::map<std::string, std::uint64_t> &counts) {
  out << "{";
  bool first = true;
  for (const auto &[name, count] : counts) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(name) << ":" << count;
  }
  out << "}";
}

} // namespace

void MetricsAccumulator::record(const std::vector<std::string> &checks,
                                const SafetyResult &result, const double latency_ms,
                                const bool cache_hit) {
  const bool blocked_by_rule =
      !result.is_safe && std::any_of(result.triggered_rules.begin(), result.triggered_rules.end(),
                                     [](const rules::TriggeredRule &rule) {
                                       return rule.action == rules::RuleAction::Block;
                                     });

  std::lock_guard<std::mutex> lock(mutex_);
  ++total_checks_;
  total_latency_ms_ += latency_ms;
  if (cache_hit) {
    ++cache_hits_;
  }
  for (const auto &check : checks) {
    ++check_counts_[check];
  }
  if (result.is_safe) {
    return;
  }
  ++blocked_;
  for (const auto &check : result.triggered_checks) {
    ++block_counts_[check];
  }
  if (blocked_by_rule) {
    ++block_counts_[kCustomRulesMetricKey];
  }
}

MetricsSnapshot MetricsAccumulator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MetricsSnapshot snapshot;
  snapshot.total_checks = total_checks_;
  snapshot.blocked = blocked_;
  snapshot.cache_hits = cache_hits_;
  snapshot.check_counts = check_counts_;
  snapshot.block_counts = block_counts_;
  if (total_checks_ > 0) {
    snapshot.block_rate = static_cast<double>(blocked_) / static_cast<double>(total_checks_);
    snapshot.avg_latency_ms = total_latency_ms_ / static_cast<double>(total_checks_);
  }
  return snapshot;
}

void MetricsAccumulator::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  total_checks_ = 0;
  blocked_ = 0;
  total_latency_ms_ = 0.0;
  cache_hits_ = 0;
  check_counts_.clear();
  block_counts_.clear();
}

std::string to_json(const MetricsSnapshot &snapshot) {
  std::ostringstream out;
  out << "{\"total_checks\":" << snapshot.total_checks << ",\"blocked\":" << snapshot.blocked
      << ",\"block_rate\":" << validators::format_score(snapshot.block_rate)
      << ",\"avg_latency_ms\":" << validators::format_score(snapshot.avg_latency_ms)
      << ",\"check_counts\":";
  write_counts(out, snapshot.check_counts);
  out << ",\"block_counts\":";
  write_counts(out, snapshot.block_counts);
  out << ",\"cache_size\":" << snapshot.cache_size << ",\"cache_hits\":" << snapshot.cache_hits
      << "}";
  return out.str();
}

} // namespace llmshield::guard
