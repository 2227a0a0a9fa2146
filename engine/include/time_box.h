#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

#include "errors.h"

namespace poolkit {

/**
 * TimeBoxRunner - run a job on a helper thread with a wall-clock budget.
 *
 * run() returns the job's result, re-throws its error, or throws
 * TimeoutError once the budget is spent. A timed-out job is not stopped:
 * it keeps running until it observes whatever cancellation the caller
 * triggers, and the destructor joins it.
 *
 * Usage:
 *   TimeBoxRunner box("load");
 *   int n = box.run([] { return count_rows(); }, std::chrono::seconds(5));
 */
class TimeBoxRunner {
 public:
  explicit TimeBoxRunner(std::string name = "time-box");
  ~TimeBoxRunner();

  TimeBoxRunner(const TimeBoxRunner&) = delete;
  TimeBoxRunner& operator=(const TimeBoxRunner&) = delete;

  // One job per runner.
  template <typename F>
  auto run(F&& job, std::chrono::milliseconds timeout)
      -> std::invoke_result_t<F> {
    using ReturnType = std::invoke_result_t<F>;

    if (helper_.joinable()) {
      throw std::logic_error("TimeBoxRunner " + name_ + " already ran a job");
    }
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::forward<F>(job));
    std::future<ReturnType> result = task->get_future();
    helper_ = std::thread([task]() { (*task)(); });

    if (result.wait_for(timeout) == std::future_status::timeout) {
      throw TimeoutError(name_ + ": job execution takes more time than " +
                         std::to_string(timeout.count()) + " ms");
    }
    return result.get();
  }

  // Wait for the helper thread, e.g. after a timeout was handled.
  void join();

  const std::string& name() const { return name_; }

 private:
  std::string name_;
  std::thread helper_;
};

}  // namespace poolkit
