#include "llmshield/observability/log_observer.hpp"

#include "llmshield/common/fs.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace llmshield::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(bool value) { return value ? "true" : "false"; }

std::string millis(std::chrono::microseconds latency) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << static_cast<double>(latency.count()) / 1000.0;
  return out.str();
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GuardStartEvent>) {
          log_line("INFO", "guard.start validators=" + common::join(evt.validators, ",") +
                               " parallel=" + bool_text(evt.parallel));
        } else if constexpr (std::is_same_v<T, CheckCompletedEvent>) {
          std::string line = "check.completed id=" + evt.fingerprint +
                             " safe=" + bool_text(evt.is_safe) +
                             " cache_hit=" + bool_text(evt.cache_hit) +
                             " latency_ms=" + millis(evt.latency);
          if (!evt.triggered.empty()) {
            line += " triggered=" + common::join(evt.triggered, ",");
          }
          log_line(evt.is_safe ? "DEBUG" : "INFO", line);
        } else if constexpr (std::is_same_v<T, RuleChangedEvent>) {
          log_line("INFO", std::string(evt.added ? "rule.added" : "rule.removed") +
                               " name=" + evt.name + " action=" + evt.action);
        } else if constexpr (std::is_same_v<T, ConfigLoadedEvent>) {
          log_line("INFO",
                   "config.loaded path=" + evt.path + " rules=" + std::to_string(evt.rules));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CheckLatencyMetric>) {
          log_line("DEBUG", "metric.check_latency_ms=" + millis(m.latency));
        } else if constexpr (std::is_same_v<T, CacheSizeMetric>) {
          log_line("DEBUG", "metric.cache_size=" + std::to_string(m.entries));
        } else if constexpr (std::is_same_v<T, BlockRateMetric>) {
          log_line("DEBUG", "metric.block_rate=" + std::to_string(m.rate));
        }
      },
      metric);
}

} // namespace llmshield::observability
