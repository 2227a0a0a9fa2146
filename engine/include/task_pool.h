#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "thread_pool.h"

namespace poolkit {

using Task = std::function<void()>;

// Soft post-shutdown wait: poll is_terminated() at most `attempts` times,
// sleeping `interval` in between. Attempt-bounded, not a wall-clock deadline.
struct TerminationPoll {
  int attempts = 3000;
  std::chrono::milliseconds interval{100};
};

struct TaskPoolOptions {
  std::string name = "task-pool";
  size_t worker_count = 1;
  // Used by invoke_all() without an explicit timeout.
  std::optional<std::chrono::milliseconds> timeout;
  bool stop_on_first_error = true;
  TerminationPoll termination_poll;
  UncaughtHandler on_uncaught;
};

/**
 * TaskPool - run a fixed collection of tasks on a private worker pool.
 *
 * Tasks are queued with add_task() and run by a single invoke_all() call,
 * which blocks until every task finished, the timeout elapsed, or (with
 * stop_on_first_error) a task failed. Only the first task error is kept;
 * it is re-thrown to the invoke_all() caller unchanged. Later errors are
 * dropped.
 *
 * With stop_on_first_error the failing task force-shuts-down the pool:
 * queued tasks are cancelled and running tasks are interrupted
 * cooperatively (see this_worker::sleep_for / check_interrupted).
 *
 * Lifecycle: CREATED → STARTED (invoke_all entered) → FINISHED (termination
 * wait over). invoke_all() must be called at most once.
 */
class TaskPool {
 public:
  explicit TaskPool(TaskPoolOptions options);
  TaskPool(std::string name, size_t worker_count,
           bool stop_on_first_error = true);
  TaskPool(std::string name, size_t worker_count,
           std::chrono::milliseconds timeout, bool stop_on_first_error = true);
  ~TaskPool();

  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;

  // Tasks added after invoke_all() started are not guaranteed to run.
  void add_task(Task task);

  // Run every queued task and wait. Uses the configured timeout, if any.
  // Throws the first task error, TimeoutError, or InterruptedError.
  void invoke_all();
  void invoke_all(std::chrono::milliseconds timeout);

  void shutdown();
  void shutdown_now();

  bool is_started() const { return started_.load(); }
  bool is_finished() const { return finished_.load(); }
  bool is_shutdown() const { return pool_.is_shutdown(); }
  bool is_terminated() const { return pool_.is_terminated(); }

  const std::string& name() const { return options_.name; }
  size_t worker_count() const { return options_.worker_count; }

 private:
  void do_invoke(std::optional<std::chrono::milliseconds> timeout);
  Task wrap(Task task);
  void record_error(std::exception_ptr error);
  void task_done();
  bool wait_for_tasks(std::optional<std::chrono::milliseconds> timeout);
  void wait_for_termination();

  TaskPoolOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  std::vector<Task> queue_;
  std::exception_ptr first_error_;
  size_t remaining_ = 0;
  bool cancelled_ = false;

  std::atomic<bool> started_{false};
  std::atomic<bool> finished_{false};

  // Declared last: its destructor joins workers still referencing the
  // members above.
  ThreadPool pool_;
};

}  // namespace poolkit
