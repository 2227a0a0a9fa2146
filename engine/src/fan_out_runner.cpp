#include "fan_out_runner.h"

#include <stdexcept>
#include <utility>

namespace poolkit {

namespace {
TaskPoolOptions validated(TaskPoolOptions options) {
  if (options.worker_count == 0) {
    throw std::invalid_argument("FanOutRunner " + options.name +
                                " requires a positive worker count");
  }
  return options;
}

TaskPoolOptions fan_out_options(std::string name, int worker_count,
                                bool stop_on_first_error) {
  if (worker_count <= 0) {
    throw std::invalid_argument("FanOutRunner " + name +
                                " requires a positive worker count, got " +
                                std::to_string(worker_count));
  }
  TaskPoolOptions options;
  options.name = std::move(name);
  options.worker_count = static_cast<size_t>(worker_count);
  options.stop_on_first_error = stop_on_first_error;
  return options;
}
}  // namespace

FanOutRunner::FanOutRunner(std::string name, int worker_count, Task task,
                           bool stop_on_first_error)
    : FanOutRunner(
          fan_out_options(std::move(name), worker_count, stop_on_first_error),
          std::move(task)) {}

FanOutRunner::FanOutRunner(TaskPoolOptions options, Task task)
    : pool_(std::make_unique<TaskPool>(validated(std::move(options)))) {
  // Every replica calls the same callable instance.
  auto shared = std::make_shared<Task>(std::move(task));
  for (size_t i = 0; i < pool_->worker_count(); ++i) {
    pool_->add_task([shared]() { (*shared)(); });
  }
}

}  // namespace poolkit
