#include "llmshield/observability/global.hpp"

#include <mutex>

namespace llmshield::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_guard_start(const std::vector<std::string> &validators, const bool parallel) {
  record_event(GuardStartEvent{.validators = validators, .parallel = parallel});
}

void record_check(const std::string &fingerprint, const bool is_safe, const bool cache_hit,
                  std::chrono::microseconds latency, const std::vector<std::string> &triggered) {
  record_event(CheckCompletedEvent{.fingerprint = fingerprint,
                                   .is_safe = is_safe,
                                   .cache_hit = cache_hit,
                                   .latency = latency,
                                   .triggered = triggered});
  record_metric(CheckLatencyMetric{.latency = latency});
}

void record_rule_change(const std::string &name, const std::string &action, const bool added) {
  record_event(RuleChangedEvent{.name = name, .action = action, .added = added});
}

void record_config_loaded(const std::string &path, const std::size_t rules) {
  record_event(ConfigLoadedEvent{.path = path, .rules = rules});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace llmshield::observability
