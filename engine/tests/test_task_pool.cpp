#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "errors.h"
#include "task_pool.h"
#include "thread_pool.h"

using namespace poolkit;
using namespace std::chrono_literals;

namespace {
TaskPoolOptions fast_options(std::string name, size_t workers,
                             bool stop_on_first_error = true) {
  TaskPoolOptions options;
  options.name = std::move(name);
  options.worker_count = workers;
  options.stop_on_first_error = stop_on_first_error;
  options.termination_poll.interval = 10ms;
  return options;
}
}  // namespace

TEST_CASE("TaskPool runs every task", "[task_pool]") {
  TaskPool pool("counter", 3, true);
  std::atomic<int> counter{0};
  for (int i = 0; i < 3; ++i) {
    pool.add_task([&counter]() { counter.fetch_add(1); });
  }

  REQUIRE_FALSE(pool.is_started());
  REQUIRE_FALSE(pool.is_finished());
  REQUIRE_FALSE(pool.is_shutdown());

  REQUIRE_NOTHROW(pool.invoke_all());

  REQUIRE(counter.load() == 3);
  REQUIRE(pool.is_started());
  REQUIRE(pool.is_finished());
  REQUIRE(pool.is_shutdown());
  REQUIRE(pool.is_terminated());
}

TEST_CASE("TaskPool runs more tasks than workers", "[task_pool]") {
  TaskPool pool(fast_options("queued", 2));
  std::atomic<int> counter{0};
  for (int i = 0; i < 20; ++i) {
    pool.add_task([&counter]() {
      std::this_thread::sleep_for(1ms);
      counter.fetch_add(1);
    });
  }

  pool.invoke_all();
  REQUIRE(counter.load() == 20);
}

TEST_CASE("TaskPool fails fast on the first error", "[task_pool]") {
  TaskPool pool("fail-fast", 2, true);
  std::atomic<bool> slow_interrupted{false};

  pool.add_task([]() { throw std::runtime_error("boom"); });
  pool.add_task([&slow_interrupted]() {
    try {
      this_worker::sleep_for(5s);
    } catch (const Interrupted&) {
      slow_interrupted = true;
      throw;
    }
  });

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_WITH(pool.invoke_all(), "boom");
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed < 1s);
  REQUIRE(slow_interrupted.load());
  REQUIRE(pool.is_finished());
  REQUIRE(pool.is_shutdown());
}

TEST_CASE("TaskPool re-throws the task error unchanged", "[task_pool]") {
  struct CustomError : std::runtime_error {
    explicit CustomError(int c) : std::runtime_error("custom"), code(c) {}
    int code;
  };

  TaskPool pool(fast_options("custom", 1));
  pool.add_task([]() { throw CustomError(42); });

  try {
    pool.invoke_all();
    FAIL("invoke_all should have thrown");
  } catch (const CustomError& e) {
    REQUIRE(e.code == 42);
  }
}

TEST_CASE("TaskPool cancels queued tasks after a failure", "[task_pool]") {
  TaskPool pool(fast_options("cancel", 1));
  std::atomic<int> ran_after_failure{0};

  pool.add_task([]() { throw std::runtime_error("first"); });
  for (int i = 0; i < 5; ++i) {
    pool.add_task([&ran_after_failure]() { ran_after_failure.fetch_add(1); });
  }

  REQUIRE_THROWS_WITH(pool.invoke_all(), "first");
  REQUIRE(ran_after_failure.load() == 0);
}

TEST_CASE("TaskPool without stop_on_first_error runs every task",
          "[task_pool]") {
  TaskPool pool(fast_options("tolerant", 4, false));
  std::atomic<int> completed{0};

  pool.add_task([]() { throw std::runtime_error("first"); });
  pool.add_task([]() {
    std::this_thread::sleep_for(100ms);
    throw std::runtime_error("second");
  });
  for (int i = 0; i < 2; ++i) {
    pool.add_task([&completed]() {
      std::this_thread::sleep_for(50ms);
      completed.fetch_add(1);
    });
  }

  REQUIRE_THROWS_WITH(pool.invoke_all(), "first");
  REQUIRE(completed.load() == 2);
  REQUIRE(pool.is_finished());
}

TEST_CASE("TaskPool invoke_all honors a timeout", "[task_pool]") {
  TaskPool pool(fast_options("slow", 2));
  pool.add_task([]() { this_worker::sleep_for(5s); });
  pool.add_task([]() {});

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(pool.invoke_all(200ms), TimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed >= 200ms);
  REQUIRE(elapsed < 2s);
  REQUIRE(pool.is_finished());
  REQUIRE(pool.is_terminated());
}

TEST_CASE("TaskPool stops polling for termination after its attempts",
          "[task_pool]") {
  TaskPoolOptions options = fast_options("stubborn", 1);
  options.termination_poll = TerminationPoll{3, 10ms};
  TaskPool pool(options);
  // Ignores interruption
  pool.add_task([]() { std::this_thread::sleep_for(1s); });

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(pool.invoke_all(100ms), TimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed >= 100ms);
  REQUIRE(elapsed < 600ms);
  REQUIRE(pool.is_finished());
  REQUIRE(pool.is_shutdown());
  REQUIRE_FALSE(pool.is_terminated());
}

TEST_CASE("TaskPool uses the timeout it was constructed with", "[task_pool]") {
  TaskPool pool("configured", 1, 100ms);
  pool.add_task([]() { this_worker::sleep_for(5s); });

  REQUIRE_THROWS_AS(pool.invoke_all(), TimeoutError);
}

TEST_CASE("TaskPool shutdown is idempotent after invocation", "[task_pool]") {
  TaskPool pool(fast_options("idempotent", 1));
  pool.add_task([]() {});
  pool.invoke_all();

  REQUIRE_NOTHROW(pool.shutdown());
  REQUIRE_NOTHROW(pool.shutdown_now());
  REQUIRE_NOTHROW(pool.shutdown());
  REQUIRE(pool.is_terminated());
}

TEST_CASE("TaskPool wraps the interruption of its invoking worker",
          "[task_pool]") {
  ThreadPool outer(ThreadPoolOptions{"outer", 1, nullptr});
  std::atomic<bool> invoking{false};

  auto outcome = outer.submit([&invoking]() -> std::pair<std::string, bool> {
    TaskPool inner(fast_options("inner", 1));
    inner.add_task([]() { this_worker::sleep_for(5s); });
    invoking = true;
    try {
      inner.invoke_all();
    } catch (const InterruptedError& e) {
      bool nested_interrupted = false;
      try {
        std::rethrow_if_nested(e);
      } catch (const Interrupted&) {
        nested_interrupted = true;
      }
      return {e.pool_name(), nested_interrupted};
    }
    return {"", false};
  });

  while (!invoking.load()) {
    std::this_thread::sleep_for(1ms);
  }
  std::this_thread::sleep_for(50ms);
  outer.shutdown_now();

  REQUIRE(outcome.wait_for(3s) == std::future_status::ready);
  auto [pool_name, nested_interrupted] = outcome.get();
  REQUIRE(pool_name == "inner");
  REQUIRE(nested_interrupted);
}
