#ifndef SOURCE_ADAPTER_HPP
#define SOURCE_ADAPTER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "StationTypes.hpp"

/**
 * Outcome of one upstream call. An empty station list with ok == true means
 * the source answered with no stations; ok == false means the source failed.
 */
struct FetchResult {
  std::vector<Station> stations;
  bool ok = true;
  std::string error;

  static FetchResult failure(const std::string& message) {
    FetchResult result;
    result.ok = false;
    result.error = message;
    return result;
  }
};

struct AdapterHealth {
  uint64_t successes = 0;
  uint64_t failures = 0;
  std::string last_error;
};

/**
 * Normalizes one upstream station feed into Station records.
 * Implementations must not throw from fetchByRadius/fetchByBounds: every
 * failure is reported through FetchResult.
 */
class SourceAdapter {
public:
  virtual ~SourceAdapter() = default;

  virtual SourceId sourceId() const = 0;
  virtual std::string name() const = 0;

  virtual FetchResult fetchByRadius(const GeoPoint& center, double radiusKm, int limit) = 0;
  virtual FetchResult fetchByBounds(const BoundingBox& bbox, int limit) = 0;

  // Whole network; defaults to a bounds fetch over the entire globe
  virtual FetchResult fetchAll(int limit);

  // Twice limit, saturating at INT_MAX
  static int overFetchLimit(int limit);

  AdapterHealth health() const {
    std::lock_guard<std::mutex> lock(health_mutex_);
    AdapterHealth h;
    h.successes = successes_.load();
    h.failures = failures_.load();
    h.last_error = last_error_;
    return h;
  }

protected:
  void recordOutcome(const FetchResult& result) {
    if (result.ok) {
      successes_++;
      return;
    }
    failures_++;
    std::lock_guard<std::mutex> lock(health_mutex_);
    last_error_ = result.error;
  }

  /**
   * Shared radius strategy: over-fetch the enclosing box, then keep stations
   * inside the circle with their distance set.
   */
  FetchResult radiusFromBounds(const GeoPoint& center, double radiusKm, int limit);

private:
  std::atomic<uint64_t> successes_{0};
  std::atomic<uint64_t> failures_{0};
  mutable std::mutex health_mutex_;
  std::string last_error_;
};

#endif // SOURCE_ADAPTER_HPP
