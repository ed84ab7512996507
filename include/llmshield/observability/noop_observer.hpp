#pragma once

#include "llmshield/observability/observer.hpp"

namespace llmshield::observability {

// Backend for observability.backend = "none".
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent & /*event*/) override {}
  void record_metric(const ObserverMetric & /*metric*/) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace llmshield::observability
