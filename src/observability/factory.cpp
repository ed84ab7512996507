#include "llmshield/observability/factory.hpp"

#include "llmshield/common/fs.hpp"
#include "llmshield/observability/log_observer.hpp"
#include "llmshield/observability/multi_observer.hpp"
#include "llmshield/observability/noop_observer.hpp"

namespace llmshield::observability {

namespace {

std::unique_ptr<IObserver> make_backend(const std::string &name) {
  if (name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto names = common::split(common::to_lower(config.observability.backend), ',');
  if (names.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (names.size() == 1) {
    return make_backend(names.front());
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : names) {
    multi->add(make_backend(name));
  }
  return multi;
}

} // namespace llmshield::observability
