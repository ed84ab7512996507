#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace llmshield::observability {

struct GuardStartEvent {
  std::vector<std::string> validators;
  bool parallel = false;
};

struct CheckCompletedEvent {
  // First characters of the input fingerprint; raw text is never recorded.
  std::string fingerprint;
  bool is_safe = true;
  bool cache_hit = false;
  std::chrono::microseconds latency{0};
  std::vector<std::string> triggered;
};

struct RuleChangedEvent {
  std::string name;
  std::string action;
  bool added = false;
};

struct ConfigLoadedEvent {
  std::string path;
  std::size_t rules = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GuardStartEvent, CheckCompletedEvent, RuleChangedEvent,
                                   ConfigLoadedEvent, ErrorEvent>;

struct CheckLatencyMetric {
  std::chrono::microseconds latency{0};
};

struct CacheSizeMetric {
  std::uint64_t entries = 0;
};

struct BlockRateMetric {
  double rate = 0.0;
};

using ObserverMetric = std::variant<CheckLatencyMetric, CacheSizeMetric, BlockRateMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace llmshield::observability
