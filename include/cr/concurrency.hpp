#pragma once

#include <functional>
#include <atomic>
#include <exception>
#include <string>

namespace cr {

// Cooperative cancellation token
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Execute fn(index) for index = 1..total with at most `concurrency` threads at a time.
// - If `cancel` is set during execution, running tasks observe it via the token
//   and no new batch is scheduled.
// - Exceptions thrown from fn are propagated (first exception wins) after all running tasks join.
void for_each_index_batched_cancelable(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel = nullptr);

// Fixed-size worker pool. Tasks run in submission order per worker; a pool of
// one thread is a serial dispatcher.
class ThreadPool {
public:
  explicit ThreadPool(int threads, std::string name = "pool");
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Enqueue a task; ignored once shutdown() started
  void submit(std::function<void()> task);

  // Wait until the queue is empty and all tasks complete
  void wait_idle();

  // Run what is queued, then join the workers. Idempotent.
  void shutdown();

  // Returns first captured exception (if any); nullptr if none
  std::exception_ptr first_exception() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace cr
