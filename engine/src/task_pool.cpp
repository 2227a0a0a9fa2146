#include "task_pool.h"

#include <utility>

#include "logging.h"

namespace poolkit {

namespace {
// Granularity at which a waiting invoker re-checks its own interruption.
constexpr std::chrono::milliseconds kWaitSlice{50};

ThreadPoolOptions make_pool_options(const TaskPoolOptions& options) {
  return ThreadPoolOptions{options.name, options.worker_count,
                           options.on_uncaught};
}
}  // namespace

TaskPool::TaskPool(TaskPoolOptions options)
    : options_(std::move(options)), pool_(make_pool_options(options_)) {}

TaskPool::TaskPool(std::string name, size_t worker_count,
                   bool stop_on_first_error)
    : TaskPool(TaskPoolOptions{std::move(name), worker_count, std::nullopt,
                               stop_on_first_error, TerminationPoll{},
                               nullptr}) {}

TaskPool::TaskPool(std::string name, size_t worker_count,
                   std::chrono::milliseconds timeout, bool stop_on_first_error)
    : TaskPool(TaskPoolOptions{std::move(name), worker_count, timeout,
                               stop_on_first_error, TerminationPoll{},
                               nullptr}) {}

TaskPool::~TaskPool() { shutdown_now(); }

void TaskPool::add_task(Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push_back(std::move(task));
}

void TaskPool::invoke_all() { do_invoke(options_.timeout); }

void TaskPool::invoke_all(std::chrono::milliseconds timeout) {
  do_invoke(timeout);
}

void TaskPool::shutdown() { pool_.shutdown(); }

void TaskPool::shutdown_now() {
  size_t discarded = pool_.shutdown_now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  done_cv_.notify_all();
  if (discarded > 0) {
    logger()->debug("{} cancelled {} queued tasks", options_.name, discarded);
  }
}

Task TaskPool::wrap(Task task) {
  return [this, task = std::move(task)]() {
    try {
      task();
    } catch (...) {
      record_error(std::current_exception());
      if (options_.stop_on_first_error) {
        shutdown_now();
      }
    }
    task_done();
  };
}

void TaskPool::record_error(std::exception_ptr error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!first_error_) {
    first_error_ = error;
  } else {
    logger()->debug("{} dropped a task error raised after the first one",
                    options_.name);
  }
}

void TaskPool::task_done() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --remaining_;
  }
  done_cv_.notify_all();
}

void TaskPool::do_invoke(std::optional<std::chrono::milliseconds> timeout) {
  started_.store(true);

  std::vector<Task> tasks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.swap(queue_);
    remaining_ = tasks.size();
  }
  logger()->debug("{} invoking {} tasks on {} workers", options_.name,
                  tasks.size(), options_.worker_count);

  for (size_t i = 0; i < tasks.size(); ++i) {
    try {
      pool_.execute(wrap(std::move(tasks[i])));
    } catch (const RejectedError&) {
      // Shut down before every task was handed over: the rest never run.
      std::lock_guard<std::mutex> lock(mutex_);
      remaining_ -= tasks.size() - i;
      if (!cancelled_ && !first_error_) {
        first_error_ = std::current_exception();
      }
      break;
    }
  }

  bool timed_out = wait_for_tasks(timeout);
  if (timed_out) {
    logger()->warn("{} timed out after {} ms, cancelling unfinished tasks",
                   options_.name, timeout->count());
    shutdown_now();
  }

  pool_.shutdown();
  wait_for_termination();
  finished_.store(true);

  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    error = first_error_;
  }
  if (error) {
    std::rethrow_exception(error);
  }
}

// Returns true if the timeout elapsed first. On timeout the TimeoutError is
// recorded as the first error so that errors of the tasks it interrupts
// are dropped.
bool TaskPool::wait_for_tasks(std::optional<std::chrono::milliseconds> timeout) {
  using Clock = std::chrono::steady_clock;
  std::optional<Clock::time_point> deadline;
  if (timeout) {
    deadline = Clock::now() + *timeout;
  }

  auto done = [this] {
    return remaining_ == 0 || cancelled_ ||
           (options_.stop_on_first_error && first_error_);
  };

  std::unique_lock<std::mutex> lock(mutex_);
  while (!done()) {
    // The invoker may itself be a worker of another, interrupted pool.
    try {
      this_worker::check_interrupted();
    } catch (const Interrupted&) {
      lock.unlock();
      shutdown_now();
      std::throw_with_nested(InterruptedError(
          options_.name, "Parallel execution interrupted for " + options_.name));
    }

    auto wake_at = Clock::now() + kWaitSlice;
    if (deadline && *deadline < wake_at) {
      wake_at = *deadline;
    }
    done_cv_.wait_until(lock, wake_at, done);

    if (!done() && deadline && Clock::now() >= *deadline) {
      if (!first_error_) {
        first_error_ = std::make_exception_ptr(TimeoutError(
            options_.name + " did not finish within " +
            std::to_string(timeout->count()) + " ms"));
      }
      return true;
    }
  }
  return false;
}

void TaskPool::wait_for_termination() {
  int attempts = options_.termination_poll.attempts;
  while (!pool_.is_terminated() && attempts-- > 0) {
    std::this_thread::sleep_for(options_.termination_poll.interval);
  }
  if (!pool_.is_terminated()) {
    logger()->warn("{} workers still running after {} termination polls",
                   options_.name, options_.termination_poll.attempts);
  }
}

}  // namespace poolkit
