#pragma once

#include "llmshield/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace llmshield::observability {

// Fans each event and metric out to its backends in insertion order.
class MultiObserver final : public IObserver {
public:
  // Drops null backends and backends whose name is already present; true when kept.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return backends_.size(); }
  [[nodiscard]] std::vector<std::string> backend_names() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
};

} // namespace llmshield::observability
