#include "llmshield/observability/multi_observer.hpp"

#include <algorithm>

namespace llmshield::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  const bool duplicate =
      std::any_of(backends_.begin(), backends_.end(),
                  [&observer](const auto &existing) { return existing->name() == observer->name(); });
  if (duplicate) {
    return false;
  }
  backends_.push_back(std::move(observer));
  return true;
}

std::vector<std::string> MultiObserver::backend_names() const {
  std::vector<std::string> names;
  names.reserve(backends_.size());
  for (const auto &backend : backends_) {
    names.emplace_back(backend->name());
  }
  return names;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  std::for_each(backends_.begin(), backends_.end(),
                [&event](const auto &backend) { backend->record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  std::for_each(backends_.begin(), backends_.end(),
                [&metric](const auto &backend) { backend->record_metric(metric); });
}

void MultiObserver::flush() {
  std::for_each(backends_.begin(), backends_.end(), [](const auto &backend) { backend->flush(); });
}

} // namespace llmshield::observability
