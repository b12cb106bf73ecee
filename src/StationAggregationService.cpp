#include "StationAggregationService.hpp"
#include "AqiAggregator.hpp"
#include "GeoMath.hpp"
#include "StationClusterer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

StationAggregationService::StationAggregationService(
    std::vector<std::shared_ptr<SourceAdapter>> adapters, const ServiceConfig& config)
    : adapters_(std::move(adapters)), config_(config),
      cache_(config.cache_max_entries, config.cache_ttl, config.cache_sweep_interval),
      debouncer_(config.debounce_delay, config.debounce_max_wait) {
  if (adapters_.empty()) {
    throw std::invalid_argument("StationAggregationService needs at least one source adapter");
  }
  for (const auto& adapter : adapters_) {
    if (!adapter) {
      throw std::invalid_argument("StationAggregationService: null source adapter");
    }
    priority_.push_back(adapter->sourceId());
  }

  cache_.startSweeper();

  std::cout << "StationAggregationService: Sources in priority order:";
  for (const auto& adapter : adapters_) {
    std::cout << " " << adapter->name();
  }
  std::cout << std::endl;
}

StationAggregationService::~StationAggregationService() {
  cache_.stopSweeper();
}

SearchResponse StationAggregationService::fetchByRadius(const GeoPoint& center, double radiusKm,
                                                        const RadiusQueryOptions& options) {
  validateCenter(center);
  validateRadius(radiusKm);
  validateLimit(options.limit);

  if (!options.debounce) {
    return runRadiusQuery(center, radiusKm, options);
  }

  // Exact parameters: coalesced callers share distances computed from one center
  std::ostringstream key_text;
  key_text << std::setprecision(17) << "radius|" << center.lat << '|' << center.lng
           << '|' << radiusKm << '|' << options.limit;
  if (options.clustering) {
    key_text << "|clustered|" << options.cluster_size_km.value_or(config_.cluster_size_km);
  }
  std::string key = "query-" + digestKey(key_text.str());

  try {
    return debouncer_.run(key, [this, center, radiusKm, options]() {
      return runRadiusQuery(center, radiusKm, options);
    });
  } catch (const DebounceCancelled& e) {
    std::cerr << "StationAggregationService: " << e.what() << std::endl;
    SearchResponse response;
    response.success = false;
    response.error = e.what();
    return response;
  }
}

SearchResponse StationAggregationService::fetchByBounds(const BoundingBox& bbox,
                                                        const BoundsQueryOptions& options) {
  if (!GeoMath::isValidBoundingBox(bbox)) {
    throw InvalidQueryError("Bounding box must satisfy north > south and east > west "
                            "with latitudes in [-90, 90] and longitudes in [-180, 180]");
  }
  validateLimit(options.limit);

  return runBoundsQuery(bbox, options);
}

SearchResponse StationAggregationService::fetchAllStations(const AllStationsQueryOptions& options) {
  validateLimit(options.limit);

  return runAllStationsQuery(options);
}

std::optional<Station> StationAggregationService::getSingleStation(const GeoPoint& center) {
  return lookupSingleStation(center).station;
}

SingleStationLookup StationAggregationService::lookupSingleStation(const GeoPoint& center) {
  validateCenter(center);

  RadiusQueryOptions options;
  options.limit = 1;
  SearchResponse response = fetchByRadius(center, config_.single_station_radius_km, options);

  SingleStationLookup lookup;
  if (response.success && !response.data.empty()) {
    lookup.station = response.data.front();
    lookup.outcome = LookupOutcome::Found;
    return lookup;
  }

  bool all_failed = response.sourcesQueried > 0 &&
                    response.sourcesFailed == response.sourcesQueried;
  lookup.outcome = (!response.success || all_failed) ? LookupOutcome::SourcesUnavailable
                                                     : LookupOutcome::NotFound;
  return lookup;
}

std::vector<StationCluster> StationAggregationService::clusterStations(
    const std::vector<Station>& stations, std::optional<double> cluster_size_km) const {
  return StationClusterer::clusterStations(stations, cluster_size_km.value_or(config_.cluster_size_km));
}

TrackingOptions StationAggregationService::getTrackingOptions(const TrackingOverrides& overrides) const {
  TrackingOptions options;
  if (overrides.enabled) options.enabled = *overrides.enabled;
  if (overrides.radiusKm) options.radiusKm = *overrides.radiusKm;
  if (overrides.updateIntervalMs) options.updateIntervalMs = *overrides.updateIntervalMs;
  if (overrides.debounceDelayMs) options.debounceDelayMs = *overrides.debounceDelayMs;
  if (overrides.maxStations) options.maxStations = *overrides.maxStations;
  if (overrides.clustering) options.clustering = *overrides.clustering;
  if (overrides.clusterSizeKm) options.clusterSizeKm = *overrides.clusterSizeKm;
  return options;
}

void StationAggregationService::clearCache() {
  cache_.clear();
  debouncer_.cancelAll();
}

CacheReport StationAggregationService::getCacheStats() const {
  CacheStoreStats stats = cache_.stats();

  CacheReport report;
  report.size = stats.size;
  report.keys = cache_.keys();
  report.hits = stats.hits;
  report.misses = stats.misses;
  report.expirations = stats.expirations;
  return report;
}

SearchResponse StationAggregationService::runRadiusQuery(const GeoPoint& center, double radiusKm,
                                                         const RadiusQueryOptions& options) {
  SearchResponse response;
  auto start = std::chrono::steady_clock::now();

  try {
    const int limit = options.limit;
    std::vector<SourceResult> sources = collectFromSources(
        [&](SourceAdapter& adapter) { return adapter.fetchByRadius(center, radiusKm, limit); },
        [&](const SourceAdapter& adapter) {
          return makeCacheKey(sourceName(adapter.sourceId()), "radius",
                              center.lat, center.lng, radiusKm, limit);
        },
        limit, response);

    std::vector<Station> merged = StationMerger::mergeBySourcePriority(
        priority_, sources, limit, config_.dedup_epsilon_deg);

    // Upstream boxes are a superset of the circle
    std::vector<Station> inside;
    inside.reserve(merged.size());
    for (auto& station : merged) {
      double distance = GeoMath::haversineDistanceKm(center.lat, center.lng,
                                                     station.lat, station.lng);
      if (distance > radiusKm) continue;
      station.distance = distance;
      inside.push_back(std::move(station));
    }

    std::stable_sort(inside.begin(), inside.end(), [](const Station& a, const Station& b) {
      return a.distance.value_or(0.0) < b.distance.value_or(0.0);
    });
    if (static_cast<int>(inside.size()) > limit) {
      inside.resize(limit);
    }

    AreaSummary summary = AqiAggregator::summarize(center.lat, center.lng, radiusKm, inside);
    if (options.clustering) {
      summary.clusters = clusterStations(inside, options.cluster_size_km);
    }

    response.success = true;
    response.data = std::move(inside);
    response.summary = std::move(summary);
  } catch (const std::exception& e) {
    std::cerr << "StationAggregationService: Error in radius query: " << e.what() << std::endl;
    response.success = false;
    response.data.clear();
    response.summary.reset();
    response.error = e.what();
    return response;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  std::cout << "StationAggregationService: Radius query (" << center.lat << ", " << center.lng
            << ") r=" << radiusKm << "km -> " << response.data.size() << " stations, "
            << response.sourcesFailed << "/" << response.sourcesQueried << " sources failed ("
            << elapsed << "ms)" << std::endl;
  return response;
}

SearchResponse StationAggregationService::runBoundsQuery(const BoundingBox& bbox,
                                                         const BoundsQueryOptions& options) {
  SearchResponse response;
  auto start = std::chrono::steady_clock::now();

  try {
    const int limit = options.limit;
    std::vector<SourceResult> sources = collectFromSources(
        [&](SourceAdapter& adapter) { return adapter.fetchByBounds(bbox, limit); },
        [&](const SourceAdapter& adapter) {
          return makeCacheKey(sourceName(adapter.sourceId()), "bounds",
                              bbox.north, bbox.south, bbox.east, bbox.west, limit);
        },
        limit, response);

    std::vector<Station> merged = StationMerger::mergeBySourcePriority(
        priority_, sources, limit, config_.dedup_epsilon_deg);

    GeoPoint center = GeoMath::boundingBoxCenter(bbox);
    AreaSummary summary = AqiAggregator::summarize(center.lat, center.lng,
                                                   GeoMath::coveringRadiusKm(bbox), merged);
    if (options.clustering) {
      summary.clusters = clusterStations(merged, options.cluster_size_km);
    }

    response.success = true;
    response.data = std::move(merged);
    response.summary = std::move(summary);
  } catch (const std::exception& e) {
    std::cerr << "StationAggregationService: Error in bounds query: " << e.what() << std::endl;
    response.success = false;
    response.data.clear();
    response.summary.reset();
    response.error = e.what();
    return response;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  std::cout << "StationAggregationService: Bounds query [" << bbox.south << ", " << bbox.west
            << " .. " << bbox.north << ", " << bbox.east << "] -> " << response.data.size()
            << " stations (" << elapsed << "ms)" << std::endl;
  return response;
}

SearchResponse StationAggregationService::runAllStationsQuery(const AllStationsQueryOptions& options) {
  SearchResponse response;
  auto start = std::chrono::steady_clock::now();

  try {
    const int limit = options.limit;
    std::vector<SourceResult> sources = collectFromSources(
        [&](SourceAdapter& adapter) { return adapter.fetchAll(limit); },
        [&](const SourceAdapter& adapter) {
          return makeCacheKey(sourceName(adapter.sourceId()), "all", limit);
        },
        limit, response);

    std::vector<Station> merged = StationMerger::mergeBySourcePriority(
        priority_, sources, limit, config_.dedup_epsilon_deg);

    AreaSummary summary;
    if (merged.empty()) {
      summary = AqiAggregator::summarize(0.0, 0.0, 0.0, merged);
    } else {
      BoundingBox extent;
      extent.north = extent.south = merged.front().lat;
      extent.east = extent.west = merged.front().lng;
      for (const auto& station : merged) {
        extent.north = std::max(extent.north, station.lat);
        extent.south = std::min(extent.south, station.lat);
        extent.east = std::max(extent.east, station.lng);
        extent.west = std::min(extent.west, station.lng);
      }
      GeoPoint center = GeoMath::boundingBoxCenter(extent);
      summary = AqiAggregator::summarize(center.lat, center.lng,
                                         GeoMath::coveringRadiusKm(extent), merged);
    }
    if (options.clustering) {
      summary.clusters = clusterStations(merged, options.cluster_size_km);
    }

    response.success = true;
    response.data = std::move(merged);
    response.summary = std::move(summary);
  } catch (const std::exception& e) {
    std::cerr << "StationAggregationService: Error in all-stations query: " << e.what() << std::endl;
    response.success = false;
    response.data.clear();
    response.summary.reset();
    response.error = e.what();
    return response;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  std::cout << "StationAggregationService: All-stations query -> " << response.data.size()
            << " stations, " << response.sourcesFailed << "/" << response.sourcesQueried
            << " sources failed (" << elapsed << "ms)" << std::endl;
  return response;
}

std::vector<SourceResult> StationAggregationService::collectFromSources(
    const FetchFn& fetch, const KeyFn& key, int limit, SearchResponse& response) {
  std::vector<SourceResult> results;

  SourceAdapter& primary = *adapters_.front();
  FetchResult primary_result = fetchCached(primary, key(primary), fetch);
  response.sourcesQueried++;
  if (!primary_result.ok) response.sourcesFailed++;
  results.push_back({primary.sourceId(), std::move(primary_result.stations)});

  if (adapters_.size() == 1) {
    return results;
  }

  if (!StationMerger::shouldFetchFallback(results.front().stations.size(), limit,
                                          config_.fallback_policy)) {
    std::cout << "StationAggregationService: " << primary.name() << " returned "
              << results.front().stations.size() << "/" << limit
              << " stations, skipping fallback sources" << std::endl;
    return results;
  }

  // Fallbacks run side by side; a slow feed only delays its own slot
  std::vector<FetchResult> fallback_results(adapters_.size() - 1);
  std::vector<std::thread> threads;
  for (size_t i = 1; i < adapters_.size(); ++i) {
    threads.emplace_back([&, i]() {
      SourceAdapter& adapter = *adapters_[i];
      fallback_results[i - 1] = fetchCached(adapter, key(adapter), fetch);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (size_t i = 1; i < adapters_.size(); ++i) {
    FetchResult& result = fallback_results[i - 1];
    response.sourcesQueried++;
    if (!result.ok) response.sourcesFailed++;
    results.push_back({adapters_[i]->sourceId(), std::move(result.stations)});
  }
  return results;
}

FetchResult StationAggregationService::fetchCached(SourceAdapter& adapter, const std::string& key,
                                                   const FetchFn& fetch) {
  std::optional<std::vector<Station>> cached = cache_.get(key);
  if (cached) {
    std::cout << "StationAggregationService: CACHE HIT " << key << " ("
              << cached->size() << " stations)" << std::endl;
    FetchResult hit;
    hit.stations = std::move(*cached);
    return hit;
  }

  FetchResult result;
  try {
    result = fetch(adapter);
  } catch (const std::exception& e) {
    // Adapters report failures by value; a throw is still an unavailable source
    std::cerr << "StationAggregationService: " << adapter.name()
              << " threw: " << e.what() << std::endl;
    result = FetchResult::failure(e.what());
  }

  if (result.ok) {
    cache_.set(key, result.stations);
  }
  return result;
}

void StationAggregationService::validateCenter(const GeoPoint& center) {
  if (!GeoMath::isValidCoordinate(center.lat, center.lng)) {
    std::ostringstream message;
    message << "Coordinates out of range: latitude must be between -90 and 90, "
            << "longitude between -180 and 180 (got " << center.lat << ", " << center.lng << ")";
    throw InvalidQueryError(message.str());
  }
}

void StationAggregationService::validateRadius(double radiusKm) {
  if (!std::isfinite(radiusKm) || radiusKm <= 0) {
    throw InvalidQueryError("Radius must be a positive number of kilometers");
  }
}

void StationAggregationService::validateLimit(int limit) {
  if (limit <= 0) {
    throw InvalidQueryError("Limit must be a positive integer");
  }
}
