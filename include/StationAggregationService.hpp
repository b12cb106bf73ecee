#ifndef STATION_AGGREGATION_SERVICE_HPP
#define STATION_AGGREGATION_SERVICE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "CacheStore.hpp"
#include "Debouncer.hpp"
#include "ServiceConfig.hpp"
#include "SourceAdapter.hpp"
#include "StationMerger.hpp"
#include "StationTypes.hpp"

/**
 * Malformed coordinates, radius, limit or bounding box. Raised before any
 * upstream call is made.
 */
class InvalidQueryError : public std::invalid_argument {
public:
  explicit InvalidQueryError(const std::string& message)
      : std::invalid_argument(message) {}
};

struct RadiusQueryOptions {
  int limit = 100;
  bool debounce = false;
  bool clustering = false;
  std::optional<double> cluster_size_km;
};

struct BoundsQueryOptions {
  int limit = 100;
  bool clustering = false;
  std::optional<double> cluster_size_km;
};

struct AllStationsQueryOptions {
  int limit = 1000;
  bool clustering = false;
  std::optional<double> cluster_size_km;
};

enum class LookupOutcome {
  Found,
  NotFound,            // sources answered, nothing near the point
  SourcesUnavailable   // every queried source failed
};

struct SingleStationLookup {
  std::optional<Station> station;
  LookupOutcome outcome = LookupOutcome::NotFound;
};

struct CacheReport {
  size_t size = 0;
  std::vector<std::string> keys;
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t expirations = 0;
};

/**
 * Query entry point of the aggregation layer.
 *
 * Owns the adapter-result cache and the debouncer; adapters are consulted in
 * the order given to the constructor, the first one being the primary source.
 * Safe to call from multiple threads.
 */
class StationAggregationService {
public:
  StationAggregationService(std::vector<std::shared_ptr<SourceAdapter>> adapters,
                            const ServiceConfig& config = ServiceConfig());
  ~StationAggregationService();

  StationAggregationService(const StationAggregationService&) = delete;
  StationAggregationService& operator=(const StationAggregationService&) = delete;

  /**
   * Stations within radiusKm of center, nearest first, at most options.limit.
   * An area with no stations is a successful, empty response.
   * Throws InvalidQueryError on bad input.
   */
  SearchResponse fetchByRadius(const GeoPoint& center, double radiusKm,
                               const RadiusQueryOptions& options = RadiusQueryOptions());

  /**
   * Stations inside bbox; the summary is centered on the box centroid with
   * the centroid-to-corner distance as radius.
   * Throws InvalidQueryError on bad input.
   */
  SearchResponse fetchByBounds(const BoundingBox& bbox,
                               const BoundsQueryOptions& options = BoundsQueryOptions());

  /**
   * Every station the sources know of, in source order, at most options.limit.
   * The summary is centered on the extent of the returned stations.
   */
  SearchResponse fetchAllStations(const AllStationsQueryOptions& options = AllStationsQueryOptions());

  // Nearest station within the single-station radius, or nullopt
  std::optional<Station> getSingleStation(const GeoPoint& center);

  // Same lookup, also telling "nothing there" apart from "sources down"
  SingleStationLookup lookupSingleStation(const GeoPoint& center);

  std::vector<StationCluster> clusterStations(const std::vector<Station>& stations,
                                              std::optional<double> cluster_size_km = std::nullopt) const;

  TrackingOptions getTrackingOptions(const TrackingOverrides& overrides = TrackingOverrides()) const;

  // Drops cached adapter results and fails pending debounced calls
  void clearCache();

  CacheReport getCacheStats() const;

  const std::vector<SourceId>& priorityOrder() const { return priority_; }

private:
  using FetchFn = std::function<FetchResult(SourceAdapter&)>;
  using KeyFn = std::function<std::string(const SourceAdapter&)>;

  SearchResponse runRadiusQuery(const GeoPoint& center, double radiusKm,
                                const RadiusQueryOptions& options);
  SearchResponse runBoundsQuery(const BoundingBox& bbox, const BoundsQueryOptions& options);
  SearchResponse runAllStationsQuery(const AllStationsQueryOptions& options);

  std::vector<SourceResult> collectFromSources(const FetchFn& fetch, const KeyFn& key,
                                               int limit, SearchResponse& response);

  FetchResult fetchCached(SourceAdapter& adapter, const std::string& key, const FetchFn& fetch);

  static void validateCenter(const GeoPoint& center);
  static void validateRadius(double radiusKm);
  static void validateLimit(int limit);

  std::vector<std::shared_ptr<SourceAdapter>> adapters_;
  std::vector<SourceId> priority_;
  ServiceConfig config_;

  CacheStore<std::vector<Station>> cache_;
  Debouncer<SearchResponse> debouncer_;
};

#endif // STATION_AGGREGATION_SERVICE_HPP
