#pragma once

#include "llmshield/observability/observer.hpp"

#include <memory>

namespace llmshield::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_guard_start(const std::vector<std::string> &validators, bool parallel);
void record_check(const std::string &fingerprint, bool is_safe, bool cache_hit,
                  std::chrono::microseconds latency, const std::vector<std::string> &triggered);
void record_rule_change(const std::string &name, const std::string &action, bool added);
void record_config_loaded(const std::string &path, std::size_t rules);
void record_error(const std::string &component, const std::string &message);

} // namespace llmshield::observability
