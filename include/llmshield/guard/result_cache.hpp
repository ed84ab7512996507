#pragma once

#include "llmshield/guard/safety_result.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace llmshield::guard {

// Bounded fingerprint -> result map. Eviction is FIFO by insertion; lookups do not refresh
// an entry's position.
class ResultCache {
public:
  explicit ResultCache(std::size_t capacity);

  [[nodiscard]] std::shared_ptr<const SafetyResult> get(const std::string &fingerprint) const;
  void put(const std::string &fingerprint, std::shared_ptr<const SafetyResult> result);
  void clear();
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<std::string> order_;
  std::unordered_map<std::string, std::shared_ptr<const SafetyResult>> entries_;
};

} // namespace llmshield::guard
