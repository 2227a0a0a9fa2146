#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "errors.h"
#include "logging.h"

namespace poolkit {

struct ResourcePoolOptions {
  std::string name = "resources";
  // Sleep between two borrow attempts.
  std::chrono::seconds request_interval{1};
  // Budget of a single borrow() call.
  std::chrono::seconds request_timeout{60};
};

/**
 * ResourcePool - borrow/release access to a fixed set of interchangeable
 * resources (sessions, connections, device slots).
 *
 * borrow() hands out the first available resource matching the predicate,
 * polling every request_interval until request_timeout elapses, then throws
 * BorrowTimeoutError. Allocation is first-match, not first-come: a caller
 * that has waited longer has no priority over one that scans next.
 *
 * Every resource given to init() is at all times either available or
 * borrowed, never both and never twice. T is compared with == to find a
 * released resource, so it should be a handle (id, pointer, name).
 *
 * Thread-safe: one mutex guards both collections. It is not held while
 * sleeping or while running a perform_action() action, but borrow() runs
 * the predicate under it: a predicate must not call back into the pool.
 *
 * Usage:
 *   ResourcePool<std::string> sessions({"sessions", 1s, 30s});
 *   sessions.init({"s1", "s2"});
 *   sessions.perform_action("test-42", [](const std::string& s) { ... });
 */
template <typename T>
class ResourcePool {
 public:
  using Predicate = std::function<bool(const T&)>;

  // RAII lease that releases its resource on destruction.
  class Lease {
   public:
    Lease(ResourcePool* pool, T resource)
        : pool_(pool), resource_(std::move(resource)) {}
    ~Lease() { reset(); }

    // Non-copyable, movable
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept
        : pool_(other.pool_), resource_(std::move(other.resource_)) {
      other.pool_ = nullptr;
    }
    Lease& operator=(Lease&& other) noexcept {
      if (this != &other) {
        reset();
        pool_ = other.pool_;
        resource_ = std::move(other.resource_);
        other.pool_ = nullptr;
      }
      return *this;
    }

    const T& get() const { return resource_; }
    const T& operator*() const { return resource_; }
    const T* operator->() const { return &resource_; }

    // Release early. Idempotent.
    void reset() {
      if (pool_) {
        pool_->release(resource_);
        pool_ = nullptr;
      }
    }

   private:
    ResourcePool* pool_;
    T resource_;
  };

  explicit ResourcePool(ResourcePoolOptions options)
      : options_(std::move(options)) {}

  ResourcePool(std::string name, std::chrono::seconds request_interval,
               std::chrono::seconds request_timeout)
      : ResourcePool(ResourcePoolOptions{std::move(name), request_interval,
                                         request_timeout}) {}

  ResourcePool(const ResourcePool&) = delete;
  ResourcePool& operator=(const ResourcePool&) = delete;

  // Move the initial resources into the pool. Call once, before borrowing.
  void init(std::vector<T> resources) {
    const size_t count = resources.size();
    logger()->info("Resource pool {} initiation started with {} records.",
                   options_.name, count);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& resource : resources) {
        available_.push_back(std::move(resource));
      }
    }
    logger()->info("Resource pool {} initiated.", options_.name);
  }

  T borrow(const std::string& requester) {
    return borrow(requester, [](const T&) { return true; });
  }

  // Throws BorrowTimeoutError if nothing matches within request_timeout.
  T borrow(const std::string& requester, const Predicate& predicate) {
    const auto deadline =
        std::chrono::steady_clock::now() + options_.request_timeout;
    logger()->trace("Attempt to borrow a resource from {} for {}",
                    options_.name, requester);

    while (true) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(available_.begin(), available_.end(),
                               [&](const T& candidate) {
                                 return predicate(candidate);
                               });
        if (it != available_.end()) {
          T resource = std::move(*it);
          available_.erase(it);
          borrowed_.push_back(resource);
          log_sizes_locked();
          return resource;
        }
        if (std::chrono::steady_clock::now() > deadline) {
          throw BorrowTimeoutError(requester, options_.name);
        }
      }
      std::this_thread::sleep_for(options_.request_interval);
    }
  }

  // Return a borrowed resource. False (no-op) if it is not borrowed from
  // this pool.
  bool release(const T& resource) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(borrowed_.begin(), borrowed_.end(), resource);
    if (it == borrowed_.end()) {
      return false;
    }
    available_.push_back(std::move(*it));
    borrowed_.erase(it);
    logger()->trace("Resource returned to pool {}.", options_.name);
    log_sizes_locked();
    return true;
  }

  Lease acquire(const std::string& requester) {
    return Lease(this, borrow(requester));
  }

  Lease acquire(const std::string& requester, const Predicate& predicate) {
    return Lease(this, borrow(requester, predicate));
  }

  // Borrow, apply `action`, release on every exit path.
  template <typename Action>
  auto perform_action(const std::string& requester, Action&& action)
      -> std::invoke_result_t<Action, const T&> {
    Lease lease = acquire(requester);
    return std::forward<Action>(action)(lease.get());
  }

  template <typename Action>
  auto perform_action(const std::string& requester, const Predicate& predicate,
                      Action&& action)
      -> std::invoke_result_t<Action, const T&> {
    Lease lease = acquire(requester, predicate);
    return std::forward<Action>(action)(lease.get());
  }

  size_t available_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
  }

  size_t borrowed_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return borrowed_.size();
  }

  const std::string& name() const { return options_.name; }

 private:
  void log_sizes_locked() const {
    logger()->trace("Resource pool {} contains {} available and {} borrowed",
                    options_.name, available_.size(), borrowed_.size());
  }

  ResourcePoolOptions options_;
  mutable std::mutex mutex_;
  std::vector<T> available_;
  std::vector<T> borrowed_;
};

}  // namespace poolkit
