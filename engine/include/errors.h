#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace poolkit {

// A bounded wait (task pool invocation, time box) elapsed before the work
// completed.
class TimeoutError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised inside a worker by the interruptible helpers in thread_pool.h once
// the worker's pool has been force-shut-down.
class Interrupted : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The coordinating thread was interrupted while waiting on a pool.
// The underlying Interrupted is nested (std::throw_with_nested).
class InterruptedError : public std::runtime_error {
 public:
  InterruptedError(std::string pool_name, const std::string& message)
      : std::runtime_error(message), pool_name_(std::move(pool_name)) {}

  const std::string& pool_name() const { return pool_name_; }

 private:
  std::string pool_name_;
};

// Job submitted to a ThreadPool that no longer accepts work.
class RejectedError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// ResourcePool::borrow found no matching resource before its deadline.
class BorrowTimeoutError : public TimeoutError {
 public:
  BorrowTimeoutError(std::string requester, std::string pool_name)
      : TimeoutError("Request timeout triggered on resource pool " + pool_name +
                     " for " + requester),
        requester_(std::move(requester)),
        pool_name_(std::move(pool_name)) {}

  const std::string& requester() const { return requester_; }
  const std::string& pool_name() const { return pool_name_; }

 private:
  std::string requester_;
  std::string pool_name_;
};

}  // namespace poolkit
