#ifndef DEBOUNCER_HPP
#define DEBOUNCER_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

class DebounceCancelled : public std::runtime_error {
public:
  explicit DebounceCancelled(const std::string& key)
      : std::runtime_error("Debounced call cancelled: " + key) {}
};

/**
 * Coalesces calls that share a key into one execution.
 *
 * The first caller for a key becomes the leader and waits on its own thread
 * until the window closes; every later caller with the same key pushes the
 * window out by `delay` (never past first call + `max_wait`) and then blocks
 * on the leader's shared result. Independent keys never wait on each other.
 */
template<typename T>
class Debouncer {
public:
  using Clock = std::chrono::steady_clock;

  Debouncer(std::chrono::milliseconds delay = std::chrono::milliseconds(300),
            std::chrono::milliseconds max_wait = std::chrono::milliseconds(2000))
      : delay_(delay), max_wait_(std::max(delay, max_wait)) {}

  ~Debouncer() {
    cancelAll();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return active_leaders_ == 0; });
  }

  Debouncer(const Debouncer&) = delete;
  Debouncer& operator=(const Debouncer&) = delete;

  /**
   * Run fn under the key's debounce window and return the shared result.
   * The most recently submitted fn of a window is the one executed.
   */
  T run(const std::string& key, std::function<T()> fn) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto now = Clock::now();

    auto it = batches_.find(key);
    if (it != batches_.end()) {
      std::shared_ptr<Batch> batch = it->second;
      batch->fn = std::move(fn);
      batch->fire_at = std::min(now + delay_, batch->deadline);
      batch->waiters++;
      coalesced_calls_++;
      std::shared_future<T> future = batch->future;
      lock.unlock();
      cv_.notify_all();
      return future.get();
    }

    auto batch = std::make_shared<Batch>();
    batch->fn = std::move(fn);
    batch->future = batch->promise.get_future().share();
    batch->fire_at = now + delay_;
    batch->deadline = now + max_wait_;
    batch->waiters = 1;
    batches_[key] = batch;
    active_leaders_++;

    while (!batch->cancelled && Clock::now() < batch->fire_at) {
      cv_.wait_until(lock, batch->fire_at);
    }

    auto current = batches_.find(key);
    if (current != batches_.end() && current->second == batch) {
      batches_.erase(current);
    }
    bool cancelled = batch->cancelled;
    std::function<T()> task = std::move(batch->fn);
    lock.unlock();

    if (cancelled) {
      batch->promise.set_exception(std::make_exception_ptr(DebounceCancelled(key)));
    } else {
      executions_++;
      try {
        batch->promise.set_value(task());
      } catch (...) {
        // Forward to every waiter of this window
        batch->promise.set_exception(std::current_exception());
      }
    }

    lock.lock();
    active_leaders_--;
    lock.unlock();
    cv_.notify_all();

    return batch->future.get();
  }

  /**
   * Fail every pending window with DebounceCancelled
   */
  void cancelAll() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto& pair : batches_) {
        pair.second->cancelled = true;
      }
      batches_.clear();
    }
    cv_.notify_all();
  }

  size_t pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.size();
  }

  uint64_t executionCount() const { return executions_.load(); }
  uint64_t coalescedCount() const { return coalesced_calls_.load(); }

private:
  struct Batch {
    std::function<T()> fn;
    std::promise<T> promise;
    std::shared_future<T> future;
    typename Clock::time_point fire_at;
    typename Clock::time_point deadline;
    int waiters = 0;
    bool cancelled = false;
  };

  std::chrono::milliseconds delay_;
  std::chrono::milliseconds max_wait_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<std::string, std::shared_ptr<Batch>> batches_;
  int active_leaders_ = 0;

  std::atomic<uint64_t> executions_{0};
  std::atomic<uint64_t> coalesced_calls_{0};
};

#endif // DEBOUNCER_HPP
