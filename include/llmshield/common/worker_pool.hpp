#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace llmshield::common {

// Fixed-size thread pool. Destruction stops intake, drains queued tasks and joins.
class WorkerPool {
public:
  explicit WorkerPool(std::size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  // Exceptions thrown by fn surface from the returned future's get().
  template <typename F> [[nodiscard]] std::future<std::invoke_result_t<F>> submit(F fn) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> future = task->get_future();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!stopping_) {
        tasks_.emplace([task]() { (*task)(); });
        cv_.notify_one();
        return future;
      }
    }
    // Pool already shut down: run on the caller's thread.
    (*task)();
    return future;
  }

  void shutdown();
  [[nodiscard]] std::size_t size() const { return threads_.size(); }

private:
  void run_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  std::vector<std::thread> threads_;
  bool stopping_ = false;
};

} // namespace llmshield::common
