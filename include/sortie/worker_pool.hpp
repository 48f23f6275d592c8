#pragma once

// sortie/worker_pool.hpp: Fixed-size FIFO thread pool.
//
// shutdown() runs every task already queued, then joins. submit() after
// shutdown returns an invalid future.

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace sortie {

class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> fut = task->get_future();
    if (!enqueue([task] { (*task)(); })) return std::future<R>{};
    return fut;
  }

  void shutdown();
  std::size_t size() const { return workers_.size(); }
  std::size_t pending() const;

 private:
  bool enqueue(std::function<void()> job);
  void worker_loop();

  std::vector<std::thread> workers_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_{false};
};

}  // namespace sortie
