#include "llmshield/guard/result_cache.hpp"

namespace llmshield::guard {

ResultCache::ResultCache(const std::size_t capacity) : capacity_(capacity) {}

std::shared_ptr<const SafetyResult> ResultCache::get(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(fingerprint);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

void ResultCache::put(const std::string &fingerprint, std::shared_ptr<const SafetyResult> result) {
  if (capacity_ == 0 || result == nullptr) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = entries_.find(fingerprint); it != entries_.end()) {
    it->second = std::move(result);
    return;
  }
  while (entries_.size() >= capacity_ && !order_.empty()) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
  order_.push_back(fingerprint);
  entries_.emplace(fingerprint, std::move(result));
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  order_.clear();
  entries_.clear();
}

std::size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace llmshield::guard
