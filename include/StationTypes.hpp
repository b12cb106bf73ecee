#ifndef STATION_TYPES_HPP
#define STATION_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

/**
 * Upstream feeds known to the aggregation layer.
 * Priority between them is decided by the adapter order given to the
 * query service, not by the enum values.
 */
enum class SourceId {
  Doe,
  Waqi,
  Snapshot
};

inline std::string sourceName(SourceId source) {
  switch (source) {
    case SourceId::Doe: return "doe";
    case SourceId::Waqi: return "waqi";
    case SourceId::Snapshot: return "snapshot";
  }
  return "unknown";
}

struct GeoPoint {
  double lat = 0.0;
  double lng = 0.0;
};

struct BoundingBox {
  double north = 0.0;
  double south = 0.0;
  double east = 0.0;
  double west = 0.0;
};

/**
 * One monitoring point, normalized from any upstream feed.
 * distance is only populated inside a radius-query result.
 */
struct Station {
  std::string id;
  std::string name;
  std::string location;
  std::optional<std::string> city;
  std::optional<std::string> country;
  std::optional<std::string> state;
  std::optional<std::string> region;
  double lat = 0.0;
  double lng = 0.0;
  std::optional<double> aqi;
  std::optional<double> pm25;
  std::optional<double> no2;
  std::optional<double> co;
  std::optional<double> o3;
  std::optional<double> so2;
  std::optional<std::string> lastUpdated;
  SourceId source = SourceId::Doe;
  std::optional<double> distance;
  std::optional<std::string> aqiClass;
  std::optional<std::string> category;
};

struct StationCluster {
  std::string id;
  double centerLat = 0.0;
  double centerLng = 0.0;
  int count = 0;
  double averageAQI = 0.0;
  std::vector<Station> stations;
};

struct AreaSummary {
  double centerLat = 0.0;
  double centerLng = 0.0;
  double radiusKm = 0.0;
  int totalStations = 0;
  double averageAQI = 0.0;
  double highestAQI = 0.0;
  double lowestAQI = 0.0;
  std::vector<Station> stations;
  std::optional<std::vector<StationCluster>> clusters;
};

struct SearchResponse {
  bool success = false;
  std::vector<Station> data;
  std::optional<AreaSummary> summary;
  std::optional<std::string> error;
  int sourcesQueried = 0;
  int sourcesFailed = 0;
};

// Real-time tracking defaults handed to map clients
struct TrackingOptions {
  bool enabled = true;
  double radiusKm = 100.0;
  int updateIntervalMs = 5000;
  int debounceDelayMs = 1000;
  int maxStations = 50;
  bool clustering = true;
  double clusterSizeKm = 5.0;
};

struct TrackingOverrides {
  std::optional<bool> enabled;
  std::optional<double> radiusKm;
  std::optional<int> updateIntervalMs;
  std::optional<int> debounceDelayMs;
  std::optional<int> maxStations;
  std::optional<bool> clustering;
  std::optional<double> clusterSizeKm;
};

#endif // STATION_TYPES_HPP
