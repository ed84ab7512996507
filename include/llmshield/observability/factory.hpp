#pragma once

#include "llmshield/config/schema.hpp"
#include "llmshield/observability/observer.hpp"

#include <memory>

namespace llmshield::observability {

// Maps observability.backend to an observer. An empty value, "none" and "noop" give a
// NoopObserver; a comma list gives a MultiObserver holding each distinct backend once.
// Names rejected by config validation fall back to the log backend.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace llmshield::observability
