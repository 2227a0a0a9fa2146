#include "thread_pool.h"

#include <utility>

#ifdef __linux__
#include <pthread.h>
#endif

#include "logging.h"

namespace poolkit {

namespace {
std::atomic<int> g_pool_number{1};

thread_local ThreadPool *t_current_pool = nullptr;
thread_local std::string t_thread_name;

// Linux limits thread names to 15 characters plus the terminator.
void set_os_thread_name(const std::string &name) {
#ifdef __linux__
  std::string truncated = name.substr(0, 15);
  pthread_setname_np(pthread_self(), truncated.c_str());
#else
  (void)name;
#endif
}

std::string describe(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}
} // namespace

ThreadPool::ThreadPool(ThreadPoolOptions options)
    : name_(std::move(options.name)),
      pool_number_(g_pool_number.fetch_add(1)),
      on_uncaught_(std::move(options.on_uncaught)) {
  if (options.num_threads == 0) {
    throw std::invalid_argument("ThreadPool " + name_ +
                                " requires at least one thread");
  }
  live_workers_ = options.num_threads;
  workers_.reserve(options.num_threads);
  for (size_t i = 0; i < options.num_threads; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

ThreadPool::ThreadPool(size_t num_threads)
    : ThreadPool(ThreadPoolOptions{"pool", num_threads, nullptr}) {}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void ThreadPool::execute(std::function<void()> job) { enqueue(std::move(job)); }

void ThreadPool::enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_) {
      throw RejectedError("submit on stopped ThreadPool " + name_);
    }
    tasks_.push(std::move(job));
  }
  cv_.notify_one();
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
}

size_t ThreadPool::shutdown_now() {
  // Destroyed outside the lock: dropping a packaged_task fulfils its future
  // with broken_promise, which may wake other threads.
  std::queue<std::function<void()>> discarded;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
    interrupted_.store(true);
    std::swap(discarded, tasks_);
  }
  cv_.notify_all();
  interrupt_cv_.notify_all();
  return discarded.size();
}

bool ThreadPool::is_shutdown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stop_;
}

bool ThreadPool::is_terminated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stop_ && live_workers_ == 0;
}

bool ThreadPool::wait_for_interrupt(std::chrono::nanoseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return interrupt_cv_.wait_for(lock, timeout,
                                [this] { return interrupted_.load(); });
}

ThreadPool *ThreadPool::current() { return t_current_pool; }

const std::string &ThreadPool::current_thread_name() { return t_thread_name; }

void ThreadPool::worker_loop(size_t index) {
  t_current_pool = this;
  t_thread_name = name_ + "-" + std::to_string(pool_number_) + "-thread-" +
                  std::to_string(index + 1);
  set_os_thread_name(t_thread_name);

  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) {
        break;
      }
      job = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      job();
    } catch (...) {
      report_uncaught(t_thread_name, std::current_exception());
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --live_workers_;
  }
  t_current_pool = nullptr;
}

void ThreadPool::report_uncaught(const std::string &thread_name,
                                 std::exception_ptr error) {
  if (on_uncaught_) {
    on_uncaught_(thread_name, error);
    return;
  }
  logger()->error("Thread {} uncaught exception: {}", thread_name,
                  describe(error));
}

namespace this_worker {

bool interrupted() {
  ThreadPool *pool = ThreadPool::current();
  return pool != nullptr && pool->is_interrupted();
}

void check_interrupted() {
  if (interrupted()) {
    throw Interrupted("Thread " + ThreadPool::current_thread_name() +
                      " interrupted");
  }
}

void sleep_for(std::chrono::nanoseconds duration) {
  ThreadPool *pool = ThreadPool::current();
  if (pool == nullptr) {
    std::this_thread::sleep_for(duration);
    return;
  }
  if (pool->wait_for_interrupt(duration)) {
    throw Interrupted("Thread " + ThreadPool::current_thread_name() +
                      " interrupted while sleeping");
  }
}

} // namespace this_worker

} // namespace poolkit
