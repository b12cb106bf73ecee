#ifndef SERVICE_CONFIG_HPP
#define SERVICE_CONFIG_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "DoeFeedAdapter.hpp"
#include "StationMerger.hpp"
#include "WaqiFeedAdapter.hpp"

/**
 * Runtime configuration. Every field has the production default; a JSON file
 * only needs the keys it wants to change, e.g.
 *
 *   {
 *     "server": { "port": 50051, "chunk_size": 10 },
 *     "cache": { "ttl_ms": 300000, "max_entries": 100, "sweep_interval_ms": 60000 },
 *     "debounce": { "delay_ms": 300, "max_wait_ms": 2000 },
 *     "merge": { "epsilon_deg": 0.001, "short_circuit": true, "short_circuit_ratio": 0.5 },
 *     "cluster": { "size_km": 5 },
 *     "sources": {
 *       "order": ["doe", "waqi", "snapshot"],
 *       "timeout_ms": 8000,
 *       "doe_url": "...", "waqi_url": "...", "waqi_token": "...",
 *       "snapshot_csv": "data/stations.csv"
 *     }
 *   }
 */
struct ServiceConfig {
  std::string listen_address = "0.0.0.0";
  int port = 50051;
  size_t chunk_size = 10;

  std::chrono::milliseconds cache_ttl = std::chrono::minutes(5);
  size_t cache_max_entries = 100;
  std::chrono::milliseconds cache_sweep_interval = std::chrono::minutes(1);

  std::chrono::milliseconds debounce_delay = std::chrono::milliseconds(300);
  std::chrono::milliseconds debounce_max_wait = std::chrono::milliseconds(2000);

  double dedup_epsilon_deg = StationMerger::DEFAULT_EPSILON_DEG;
  FallbackPolicy fallback_policy;
  double cluster_size_km = 5.0;

  int default_limit = 100;
  double default_radius_km = 100.0;
  double single_station_radius_km = 0.1;

  std::vector<std::string> source_order = {"doe", "waqi"};
  std::chrono::milliseconds source_timeout = std::chrono::milliseconds(8000);
  std::string doe_url = DoeFeedAdapter::DEFAULT_QUERY_URL;
  std::string waqi_url = WaqiFeedAdapter::DEFAULT_BOUNDS_URL;
  std::string waqi_token;
  std::string snapshot_csv;
};

/**
 * Load configuration from a JSON file on top of the defaults.
 * Throws std::runtime_error when the file is unreadable, not JSON, or a known
 * key has the wrong type. AIRGEO_WAQI_TOKEN in the environment overrides the
 * file's WAQI token.
 */
ServiceConfig loadServiceConfig(const std::string& path);

// Defaults plus environment overrides only
ServiceConfig defaultServiceConfig();

void applyEnvironmentOverrides(ServiceConfig& config);

/**
 * Instantiate adapters in config.source_order; the first entry is the
 * primary source. Throws std::runtime_error on an unknown or repeated name.
 */
std::vector<std::shared_ptr<SourceAdapter>> buildSourceAdapters(const ServiceConfig& config);

void printServiceConfig(const ServiceConfig& config);

#endif // SERVICE_CONFIG_HPP
