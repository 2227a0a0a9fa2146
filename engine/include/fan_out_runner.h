#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "task_pool.h"

namespace poolkit {

// Run the same task on `worker_count` workers at once (load generation,
// parallel repeated attempts). Lifecycle and failure policy are those of
// the private TaskPool it delegates to.
class FanOutRunner {
 public:
  // Throws std::invalid_argument if worker_count <= 0.
  FanOutRunner(std::string name, int worker_count, Task task,
               bool stop_on_first_error = true);
  FanOutRunner(TaskPoolOptions options, Task task);

  void invoke_all() { pool_->invoke_all(); }
  void invoke_all(std::chrono::milliseconds timeout) {
    pool_->invoke_all(timeout);
  }

  void shutdown() { pool_->shutdown(); }
  void shutdown_now() { pool_->shutdown_now(); }

  bool is_started() const { return pool_->is_started(); }
  bool is_finished() const { return pool_->is_finished(); }
  bool is_shutdown() const { return pool_->is_shutdown(); }
  bool is_terminated() const { return pool_->is_terminated(); }

  const std::string& name() const { return pool_->name(); }
  size_t worker_count() const { return pool_->worker_count(); }

 private:
  std::unique_ptr<TaskPool> pool_;
};

}  // namespace poolkit
