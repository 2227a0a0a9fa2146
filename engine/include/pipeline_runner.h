#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "errors.h"
#include "fan_out_runner.h"
#include "logging.h"
#include "task_pool.h"
#include "time_box.h"

namespace poolkit {

// End-of-stream signal shared by producers and consumers.
// Monotonic: once set it stays set.
class EofFlag {
 public:
  void set() { value_.store(true); }
  bool is_set() const { return value_.load(); }

 private:
  std::atomic<bool> value_{false};
};

struct PipelineOptions {
  std::string name = "pipeline";
  size_t parallel_input_count = 1;
  size_t parallel_output_count = 1;
  // Used by run() without an explicit timeout.
  std::optional<std::chrono::milliseconds> timeout;
  // Consumer sleep when the buffers are empty; producer sleep after an
  // empty batch.
  std::chrono::milliseconds backoff{500};
  TerminationPoll termination_poll;
};

/**
 * PipelineRunner - producer group and consumer group joined by a buffer.
 *
 * parallel_input_count producers call the input function and append what it
 * returns to a shared buffer until the EOF flag is set. parallel_output_count
 * consumers move the shared buffer into their output buffer under one mutex,
 * take one item at a time and hand it to the output function. Either side
 * may set EOF. Consumers keep draining until EOF is set, no producer is
 * active and both buffers are empty.
 *
 * Errors are first-wins across both groups. Any recorded error (or a run()
 * timeout) forces both groups down, sets EOF and is re-thrown from run().
 * run(timeout) throws at the deadline without waiting for an item that
 * ignores interruption; the destructor waits for it instead.
 *
 * Usage:
 *   PipelineRunner<int> pipeline("numbers", 1, 2);
 *   pipeline.set_input_executor([n = 0](EofFlag& eof) mutable
 *                                   -> std::optional<int> {
 *     if (++n == 100) eof.set();
 *     return n;
 *   });
 *   pipeline.set_output_executor([](EofFlag&, int v) { consume(v); });
 *   pipeline.run();
 */
template <typename T>
class PipelineRunner {
 public:
  // Returns the next item, or nullopt if this call produced nothing.
  using InputFn = std::function<std::optional<T>(EofFlag&)>;
  // Returns a batch of items; an empty batch backs off before the next call.
  using BatchInputFn = std::function<std::vector<T>(EofFlag&)>;
  using OutputFn = std::function<void(EofFlag&, T)>;

  explicit PipelineRunner(PipelineOptions options)
      : options_(std::move(options)) {
    if (options_.parallel_input_count == 0 ||
        options_.parallel_output_count == 0) {
      throw std::invalid_argument("Pipeline " + options_.name +
                                  " requires positive input and output counts");
    }
    options_.name = "Parallel IO " + options_.name;
  }

  PipelineRunner(std::string name, size_t parallel_input_count,
                 size_t parallel_output_count)
      : PipelineRunner(PipelineOptions{std::move(name), parallel_input_count,
                                       parallel_output_count, std::nullopt}) {}

  PipelineRunner(std::string name, size_t parallel_input_count,
                 size_t parallel_output_count,
                 std::chrono::milliseconds timeout)
      : PipelineRunner(PipelineOptions{std::move(name), parallel_input_count,
                                       parallel_output_count, timeout}) {}

  PipelineRunner(const PipelineRunner&) = delete;
  PipelineRunner& operator=(const PipelineRunner&) = delete;

  void set_input_executor(InputFn input) {
    input_ = make_group(" Input", options_.parallel_input_count,
                        [this, input = std::move(input)]() {
                          run_producer([&]() {
                            std::optional<T> item = input(eof_);
                            if (item) {
                              std::vector<T> one;
                              one.push_back(std::move(*item));
                              append(std::move(one));
                            }
                          });
                        });
  }

  void set_batch_input_executor(BatchInputFn input) {
    input_ = make_group(" Input", options_.parallel_input_count,
                        [this, input = std::move(input)]() {
                          run_producer([&]() {
                            std::vector<T> batch = input(eof_);
                            if (!batch.empty()) {
                              append(std::move(batch));
                            } else if (!eof_.is_set()) {
                              this_worker::sleep_for(options_.backoff);
                            }
                          });
                        });
  }

  void set_output_executor(OutputFn output) {
    output_ = make_group(" Output", options_.parallel_output_count,
                         [this, output = std::move(output)]() {
                           run_consumer(output);
                         });
  }

  // Uses the configured timeout, if any.
  void run() {
    if (options_.timeout) {
      run(*options_.timeout);
      return;
    }
    ensure_ready();
    logger()->info("{} started", options_.name);
    run_groups(std::nullopt);
    finish();
  }

  void run(std::chrono::milliseconds timeout) {
    ensure_ready();
    logger()->info("{} started with a {} ms timeout", options_.name,
                   timeout.count());
    if (box_) {
      throw std::logic_error(options_.name + ": run() called twice");
    }
    box_ = std::make_unique<TimeBoxRunner>(options_.name);
    try {
      box_->run([this, timeout]() { run_groups(timeout); }, timeout);
      box_->join();
    } catch (const TimeoutError& e) {
      // Groups still winding down are joined by the destructor.
      logger()->warn("{}", e.what());
      record_error(std::current_exception());
      force_stop();
    }
    finish();
  }

  bool is_started() const {
    return (input_ && input_->is_started()) ||
           (output_ && output_->is_started());
  }

  bool is_live() const {
    return !(is_finished() || is_shutdown() || is_terminated()) && !has_error();
  }

  bool is_finished() const {
    return input_ && output_ && input_->is_finished() &&
           output_->is_finished();
  }

  bool is_shutdown() const {
    return input_ && output_ && input_->is_shutdown() &&
           output_->is_shutdown();
  }

  bool is_terminated() const {
    return input_ && output_ && input_->is_terminated() &&
           output_->is_terminated();
  }

  bool eof() const { return eof_.is_set(); }
  int active_producers() const { return active_producers_.load(); }
  const std::string& name() const { return options_.name; }

 private:
  // Keeps active_producers_ raised for the lifetime of a producer task.
  class ProducerScope {
   public:
    explicit ProducerScope(std::atomic<int>& counter) : counter_(counter) {
      counter_.fetch_add(1);
    }
    ~ProducerScope() { counter_.fetch_sub(1); }

    ProducerScope(const ProducerScope&) = delete;
    ProducerScope& operator=(const ProducerScope&) = delete;

   private:
    std::atomic<int>& counter_;
  };

  std::unique_ptr<FanOutRunner> make_group(const char* suffix, size_t count,
                                           Task body) {
    TaskPoolOptions group;
    group.name = options_.name + suffix;
    group.worker_count = count;
    group.termination_poll = options_.termination_poll;
    return std::make_unique<FanOutRunner>(std::move(group), std::move(body));
  }

  template <typename ProduceOnce>
  void run_producer(ProduceOnce produce_once) {
    ProducerScope scope(active_producers_);
    try {
      do {
        produce_once();
      } while (!eof_.is_set() && is_live());
    } catch (...) {
      record_error(std::current_exception());
      throw;
    }
  }

  void run_consumer(const OutputFn& output) {
    try {
      do {
        if (has_error()) {
          break;
        }

        std::optional<T> item = take();
        if (!item) {
          this_worker::sleep_for(options_.backoff);
          continue;
        }

        output(eof_, std::move(*item));
        if (has_error()) {
          break;
        }
      } while ((!eof_.is_set() || active_producers_.load() > 0 ||
                !buffers_empty()) &&
               is_live());
    } catch (...) {
      record_error(std::current_exception());
      throw;
    }
  }

  void append(std::vector<T> items) {
    size_t shared_size = 0;
    {
      std::lock_guard<std::mutex> lock(buffer_mutex_);
      for (auto& item : items) {
        shared_buffer_.push_back(std::move(item));
      }
      shared_size = shared_buffer_.size();
    }
    logger()->debug("{} added {} records, shared buffer size is {}",
                    options_.name, items.size(), shared_size);
  }

  std::optional<T> take() {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    while (!shared_buffer_.empty()) {
      output_buffer_.push_back(std::move(shared_buffer_.front()));
      shared_buffer_.pop_front();
    }
    if (output_buffer_.empty()) {
      return std::nullopt;
    }
    std::optional<T> item(std::move(output_buffer_.front()));
    output_buffer_.pop_front();
    return item;
  }

  bool buffers_empty() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return shared_buffer_.empty() && output_buffer_.empty();
  }

  void record_error(std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    if (!error_) {
      error_ = error;
    }
  }

  bool has_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return static_cast<bool>(error_);
  }

  void ensure_ready() const {
    if (!input_ || !output_) {
      throw std::logic_error(options_.name +
                             ": set the input and output executors before run()");
    }
  }

  // Producers on their own thread, consumers on the calling thread.
  void run_groups(std::optional<std::chrono::milliseconds> timeout) {
    std::thread producers([this, timeout]() {
      try {
        if (timeout) {
          input_->invoke_all(*timeout);
        } else {
          input_->invoke_all();
        }
      } catch (...) {
        record_error(std::current_exception());
      }
      eof_.set();
    });

    try {
      if (timeout) {
        output_->invoke_all(*timeout);
      } else {
        output_->invoke_all();
      }
    } catch (...) {
      record_error(std::current_exception());
    }

    if (has_error()) {
      force_stop();
    }
    producers.join();
  }

  void force_stop() {
    eof_.set();
    input_->shutdown_now();
    output_->shutdown_now();
  }

  void finish() {
    std::exception_ptr error;
    {
      std::lock_guard<std::mutex> lock(error_mutex_);
      error = error_;
    }
    if (error) {
      force_stop();
      std::rethrow_exception(error);
    }
    logger()->info("{} finished", options_.name);
  }

  PipelineOptions options_;
  EofFlag eof_;
  std::atomic<int> active_producers_{0};

  mutable std::mutex buffer_mutex_;
  std::deque<T> shared_buffer_;
  std::deque<T> output_buffer_;

  mutable std::mutex error_mutex_;
  std::exception_ptr error_;

  // Declared last: destroying a group joins workers using the state above.
  std::unique_ptr<FanOutRunner> input_;
  std::unique_ptr<FanOutRunner> output_;
  // After the groups: destroyed first, joining a run that outlived its
  // timeout before the groups go away.
  std::unique_ptr<TimeBoxRunner> box_;
};

}  // namespace poolkit
