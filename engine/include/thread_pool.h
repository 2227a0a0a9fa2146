#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "errors.h"

namespace poolkit {

// Called with the worker's name when a fire-and-forget job throws.
using UncaughtHandler =
    std::function<void(const std::string& thread_name, std::exception_ptr error)>;

struct ThreadPoolOptions {
  // Prefix for worker names: "<name>-<pool number>-thread-<n>"
  std::string name = "pool";
  size_t num_threads = 4;
  // Defaults to logging the error on the poolkit logger.
  UncaughtHandler on_uncaught;
};

// Fixed-size thread pool with named workers and cooperative interruption.
//
// Lifecycle:
//   running → shutdown requested → terminated (every worker exited)
//
// shutdown() lets queued jobs drain; shutdown_now() discards queued jobs and
// raises the interruption flag, which running jobs observe through the
// this_worker helpers below. Nothing is ever preempted.
class ThreadPool {
public:
  explicit ThreadPool(ThreadPoolOptions options);
  explicit ThreadPool(size_t num_threads = 4);
  ~ThreadPool();

  // Non-copyable, non-movable
  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  // Submit a task and get a future for the result.
  // Throws RejectedError once shutdown was requested.
  // If the task is discarded by shutdown_now() the future reports
  // std::future_errc::broken_promise.
  template <typename F>
  auto submit(F &&f) -> std::future<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(f));
    std::future<ReturnType> result = task->get_future();
    enqueue([task]() { (*task)(); });
    return result;
  }

  // Fire-and-forget. A throwing job is reported to on_uncaught.
  void execute(std::function<void()> job);

  // Stop accepting jobs; queued and running jobs complete. Idempotent.
  void shutdown();

  // Stop accepting jobs, discard queued jobs and interrupt running ones.
  // Returns the number of discarded jobs. Idempotent.
  size_t shutdown_now();

  bool is_shutdown() const;
  // Shutdown requested and every worker thread has exited.
  bool is_terminated() const;
  bool is_interrupted() const { return interrupted_.load(); }

  // Block the calling thread for up to `timeout` or until the pool is
  // interrupted. Returns true if interrupted.
  bool wait_for_interrupt(std::chrono::nanoseconds timeout);

  // Get number of worker threads
  size_t size() const { return workers_.size(); }

  const std::string &name() const { return name_; }

  // Pool owning the calling thread, nullptr if not a worker.
  static ThreadPool *current();

  // Name of the calling worker thread, empty if not a worker.
  static const std::string &current_thread_name();

private:
  void enqueue(std::function<void()> job);
  void worker_loop(size_t index);
  void report_uncaught(const std::string &thread_name, std::exception_ptr error);

  std::string name_;
  int pool_number_;
  UncaughtHandler on_uncaught_;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable interrupt_cv_;
  std::atomic<bool> interrupted_{false};
  size_t live_workers_ = 0;
  bool stop_ = false;
};

// Cooperative interruption helpers for code running inside a ThreadPool job.
namespace this_worker {

// True if the calling thread is a worker whose pool was shutdown_now()'ed.
bool interrupted();

// Throws Interrupted if interrupted().
void check_interrupted();

// Sleep for `duration`, waking early and throwing Interrupted if the
// worker's pool is interrupted. Plain sleep on non-worker threads.
void sleep_for(std::chrono::nanoseconds duration);

} // namespace this_worker

} // namespace poolkit
