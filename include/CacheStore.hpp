#ifndef CACHE_STORE_HPP
#define CACHE_STORE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

template<typename T>
struct CacheEntry {
  T data;
  std::chrono::steady_clock::time_point timestamp;
  std::chrono::steady_clock::time_point expiry;
  int hit_count = 0;
};

struct CacheStoreStats {
  size_t size = 0;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t expirations = 0;
};

/**
 * TTL cache for upstream adapter results.
 *
 * Live entries are never evicted: once the entry count crosses max_entries,
 * a set() sweeps expired entries only. Under sustained misses with long TTLs
 * the store can therefore grow past max_entries until entries expire.
 */
template<typename T>
class CacheStore {
public:
  using Clock = std::chrono::steady_clock;

  CacheStore(size_t max_entries = 100,
             std::chrono::milliseconds default_ttl = std::chrono::minutes(5),
             std::chrono::milliseconds sweep_interval = std::chrono::minutes(1))
      : max_entries_(max_entries), default_ttl_(default_ttl),
        sweep_interval_(sweep_interval), running_(false) {
    std::cout << "CacheStore: Initialized with max_entries=" << max_entries
              << ", TTL=" << default_ttl.count() << "ms" << std::endl;
  }

  ~CacheStore() {
    stopSweeper();
  }

  CacheStore(const CacheStore&) = delete;
  CacheStore& operator=(const CacheStore&) = delete;

  std::optional<T> get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
      misses_++;
      return std::nullopt;
    }

    if (Clock::now() >= it->second.expiry) {
      cache_.erase(it);
      misses_++;
      expirations_++;
      return std::nullopt;
    }

    it->second.hit_count++;
    hits_++;
    return it->second.data;
  }

  void set(const std::string& key, const T& value) {
    set(key, value, default_ttl_);
  }

  void set(const std::string& key, const T& value, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry<T> entry{value, Clock::now(), Clock::now() + ttl, 0};
    cache_[key] = std::move(entry);

    if (cache_.size() > max_entries_) {
      sweepExpiredLocked();
    }
  }

  size_t sweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweepExpiredLocked();
  }

  void invalidate(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(key);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    std::cout << "CacheStore: Cache cleared" << std::endl;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
  }

  std::vector<std::string> keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(cache_.size());
    for (const auto& pair : cache_) {
      result.push_back(pair.first);
    }
    return result;
  }

  CacheStoreStats stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStoreStats s;
    s.size = cache_.size();
    s.hits = hits_;
    s.misses = misses_;
    s.expirations = expirations_;
    return s;
  }

  /**
   * Start the periodic expired-entry sweep on a background thread
   */
  void startSweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (running_) return;
    running_ = true;
    sweeper_thread_ = std::thread(&CacheStore::sweepLoop, this);
  }

  void stopSweeper() {
    {
      std::lock_guard<std::mutex> lock(sweeper_mutex_);
      if (!running_) return;
      running_ = false;
    }
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
      sweeper_thread_.join();
    }
  }

private:
  size_t sweepExpiredLocked() {
    auto now = Clock::now();
    size_t removed = 0;

    for (auto it = cache_.begin(); it != cache_.end(); ) {
      if (now >= it->second.expiry) {
        it = cache_.erase(it);
        removed++;
      } else {
        ++it;
      }
    }

    expirations_ += removed;
    if (removed > 0) {
      std::cout << "CacheStore: Swept " << removed << " expired entries ("
                << cache_.size() << " remaining)" << std::endl;
    }
    return removed;
  }

  void sweepLoop() {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (running_) {
      sweeper_cv_.wait_for(lock, sweep_interval_, [this] { return !running_; });
      if (!running_) break;

      lock.unlock();
      sweepExpired();
      lock.lock();
    }
  }

  std::unordered_map<std::string, CacheEntry<T>> cache_;
  mutable std::mutex mutex_;
  size_t max_entries_;
  std::chrono::milliseconds default_ttl_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t expirations_ = 0;

  std::chrono::milliseconds sweep_interval_;
  std::thread sweeper_thread_;
  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool running_;
};

/**
 * Deterministic cache key for an adapter call.
 * Coordinates are rounded to 3 decimals (~111 m) so GPS jitter around the
 * same spot shares one entry.
 */
std::string makeCacheKey(const std::string& adapter, const std::string& kind,
                         double lat, double lng, double radius_km, int limit);

std::string makeCacheKey(const std::string& adapter, const std::string& kind,
                         double north, double south, double east, double west,
                         int limit);

std::string makeCacheKey(const std::string& adapter, const std::string& kind, int limit);

// 64-bit FNV-1a rendered as 16 hex digits
std::string digestKey(const std::string& canonical);

#endif // CACHE_STORE_HPP
