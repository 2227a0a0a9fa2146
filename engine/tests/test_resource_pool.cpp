#include <catch2/catch_test_macros.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "errors.h"
#include "resource_pool.h"

using namespace poolkit;
using namespace std::chrono_literals;

namespace {
bool starts_with(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}
}  // namespace

TEST_CASE("ResourcePool lends distinct resources and times out when empty",
          "[resource_pool]") {
  ResourcePool<std::string> pool("browsers", 1s, 2s);
  pool.init({"A", "B"});

  auto x = std::async(std::launch::async, [&pool]() { return pool.borrow("x"); });
  auto y = std::async(std::launch::async, [&pool]() { return pool.borrow("y"); });
  std::string first = x.get();
  std::string second = y.get();

  REQUIRE(first != second);
  REQUIRE((first == "A" || first == "B"));
  REQUIRE((second == "A" || second == "B"));
  REQUIRE(pool.available_size() == 0);
  REQUIRE(pool.borrowed_size() == 2);

  auto start = std::chrono::steady_clock::now();
  try {
    pool.borrow("z");
    FAIL("borrow should have timed out");
  } catch (const BorrowTimeoutError& e) {
    REQUIRE(e.requester() == "z");
    REQUIRE(e.pool_name() == "browsers");
    REQUIRE(std::string(e.what()) ==
            "Request timeout triggered on resource pool browsers for z");
  }
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(elapsed >= 2s);
  REQUIRE(elapsed < 4s);

  REQUIRE(pool.release(first));
  REQUIRE(pool.release(second));
  REQUIRE(pool.available_size() == 2);
  REQUIRE(pool.borrowed_size() == 0);
}

TEST_CASE("ResourcePool picks the first resource matching the predicate",
          "[resource_pool]") {
  ResourcePool<std::string> pool("sessions", 1s, 1s);
  pool.init({"chrome-1", "firefox-1", "chrome-2"});

  auto is_firefox = [](const std::string& s) {
    return starts_with(s, "firefox");
  };
  auto is_chrome = [](const std::string& s) { return starts_with(s, "chrome"); };

  REQUIRE(pool.borrow("t1", is_firefox) == "firefox-1");
  REQUIRE(pool.borrow("t2", is_chrome) == "chrome-1");
  REQUIRE(pool.borrow("t3", is_chrome) == "chrome-2");
  REQUIRE_THROWS_AS(pool.borrow("t4", is_chrome), BorrowTimeoutError);
}

TEST_CASE("ResourcePool borrow is bounded for a never-matching predicate",
          "[resource_pool]") {
  ResourcePool<int> pool("numbers", 1s, 1s);
  pool.init({1, 2, 3});

  auto start = std::chrono::steady_clock::now();
  REQUIRE_THROWS_AS(pool.borrow("nobody", [](const int& n) { return n > 10; }),
                    TimeoutError);
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed >= 1s);
  REQUIRE(elapsed < 3s);
  REQUIRE(pool.available_size() == 3);
  REQUIRE(pool.borrowed_size() == 0);
}

TEST_CASE("ResourcePool waits for a released resource", "[resource_pool]") {
  ResourcePool<int> pool("single", 1s, 10s);
  pool.init({7});
  int held = pool.borrow("holder");

  auto waiter =
      std::async(std::launch::async, [&pool]() { return pool.borrow("waiter"); });
  std::this_thread::sleep_for(100ms);
  REQUIRE(pool.release(held));

  REQUIRE(waiter.wait_for(5s) == std::future_status::ready);
  REQUIRE(waiter.get() == 7);
  REQUIRE(pool.borrowed_size() == 1);
}

TEST_CASE("ResourcePool release ignores resources it did not lend",
          "[resource_pool]") {
  ResourcePool<std::string> pool("strict", 1s, 1s);
  pool.init({"A"});

  REQUIRE_FALSE(pool.release("A"));
  REQUIRE_FALSE(pool.release("unknown"));
  REQUIRE(pool.available_size() == 1);

  std::string a = pool.borrow("r");
  REQUIRE(pool.release(a));
  REQUIRE_FALSE(pool.release(a));
  REQUIRE(pool.available_size() == 1);
  REQUIRE(pool.borrowed_size() == 0);
}

TEST_CASE("ResourcePool conserves its resources", "[resource_pool]") {
  ResourcePool<int> pool("conserved", 1s, 1s);
  pool.init({1, 2, 3});

  int a = pool.borrow("r");
  REQUIRE(pool.available_size() + pool.borrowed_size() == 3);
  int b = pool.borrow("r");
  REQUIRE(pool.available_size() + pool.borrowed_size() == 3);
  REQUIRE(pool.release(a));
  REQUIRE(pool.available_size() + pool.borrowed_size() == 3);
  int c = pool.borrow("r");
  REQUIRE(pool.available_size() + pool.borrowed_size() == 3);
  REQUIRE(pool.release(b));
  REQUIRE(pool.release(c));
  REQUIRE(pool.available_size() == 3);
}

TEST_CASE("ResourcePool perform_action returns the result and releases",
          "[resource_pool]") {
  ResourcePool<std::string> pool("actions", 1s, 1s);
  pool.init({"db-1"});

  std::string used =
      pool.perform_action("reader", [](const std::string& s) { return s + "!"; });
  REQUIRE(used == "db-1!");
  REQUIRE(pool.available_size() == 1);

  REQUIRE_THROWS_WITH(pool.perform_action("writer",
                                          [](const std::string&) -> int {
                                            throw std::runtime_error("query");
                                          }),
                      "query");
  REQUIRE(pool.available_size() == 1);
  REQUIRE(pool.borrowed_size() == 0);

  bool matched = pool.perform_action(
      "picky", [](const std::string& s) { return s == "db-1"; },
      [](const std::string& s) { return s == "db-1"; });
  REQUIRE(matched);
}

TEST_CASE("ResourcePool lease releases on scope exit", "[resource_pool]") {
  ResourcePool<int> pool("leases", 1s, 1s);
  pool.init({1, 2});

  {
    auto lease = pool.acquire("scoped");
    REQUIRE(*lease == 1);
    REQUIRE(pool.borrowed_size() == 1);

    auto moved = std::move(lease);
    REQUIRE(moved.get() == 1);
    REQUIRE(pool.borrowed_size() == 1);

    moved.reset();
    REQUIRE(pool.borrowed_size() == 0);
    moved.reset();
  }
  {
    auto lease = pool.acquire("scoped", [](const int& n) { return n == 2; });
    REQUIRE(lease.get() == 2);
  }
  REQUIRE(pool.available_size() == 2);
  REQUIRE(pool.borrowed_size() == 0);
}

TEST_CASE("ResourcePool never lends a resource twice", "[resource_pool]") {
  constexpr int kThreads = 4;
  constexpr int kRounds = 3;
  ResourcePool<int> pool("contended", 1s, 30s);
  pool.init({0, 1, 2});

  std::array<std::atomic<int>, 3> holders{};
  std::atomic<bool> double_borrow{false};
  std::atomic<int> actions{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kRounds; ++i) {
        pool.perform_action("worker-" + std::to_string(t), [&](const int& r) {
          if (holders[static_cast<size_t>(r)].fetch_add(1) != 0) {
            double_borrow = true;
          }
          std::this_thread::sleep_for(5ms);
          holders[static_cast<size_t>(r)].fetch_sub(1);
          actions.fetch_add(1);
        });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  REQUIRE_FALSE(double_borrow.load());
  REQUIRE(actions.load() == kThreads * kRounds);
  REQUIRE(pool.available_size() == 3);
  REQUIRE(pool.borrowed_size() == 0);
}

TEST_CASE("ResourcePool actions may query the pool", "[resource_pool]") {
  ResourcePool<int> pool("reentrant", 1s, 1s);
  pool.init({1, 2});

  auto sizes = pool.perform_action(
      "inspector", [](const int& n) { return n == 2; },
      [&pool](const int&) {
        return std::make_pair(pool.available_size(), pool.borrowed_size());
      });
  REQUIRE(sizes.first == 1);
  REQUIRE(sizes.second == 1);
  REQUIRE(pool.available_size() == 2);
}
