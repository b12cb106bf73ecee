#include "ServiceConfig.hpp"
#include "CsvStationAdapter.hpp"
#include "JsonFields.hpp"
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <set>
#include <stdexcept>

namespace {

std::runtime_error typeError(const std::string& section, const char* key, const char* expected) {
  return std::runtime_error("config: " + section + "." + key + " must be " + expected);
}

void readNumber(const Json::Value& section, const std::string& name, const char* key, double& target) {
  if (!section.isMember(key)) return;
  if (!section[key].isNumeric()) throw typeError(name, key, "a number");
  target = section[key].asDouble();
}

void readCount(const Json::Value& section, const std::string& name, const char* key, long long& target) {
  if (!section.isMember(key)) return;
  if (!section[key].isIntegral() || section[key].asLargestInt() < 0) {
    throw typeError(name, key, "a non-negative integer");
  }
  target = section[key].asLargestInt();
}

void readMillis(const Json::Value& section, const std::string& name, const char* key,
                std::chrono::milliseconds& target) {
  long long value = target.count();
  readCount(section, name, key, value);
  target = std::chrono::milliseconds(value);
}

void readBool(const Json::Value& section, const std::string& name, const char* key, bool& target) {
  if (!section.isMember(key)) return;
  if (!section[key].isBool()) throw typeError(name, key, "a boolean");
  target = section[key].asBool();
}

void readString(const Json::Value& section, const std::string& name, const char* key, std::string& target) {
  if (!section.isMember(key)) return;
  if (!section[key].isString()) throw typeError(name, key, "a string");
  target = section[key].asString();
}

const Json::Value& section(const Json::Value& root, const char* name) {
  static const Json::Value empty(Json::objectValue);
  if (!root.isMember(name)) return empty;
  if (!root[name].isObject()) {
    throw std::runtime_error(std::string("config: ") + name + " must be an object");
  }
  return root[name];
}

} // namespace

ServiceConfig defaultServiceConfig() {
  ServiceConfig config;
  applyEnvironmentOverrides(config);
  return config;
}

void applyEnvironmentOverrides(ServiceConfig& config) {
  const char* token = std::getenv("AIRGEO_WAQI_TOKEN");
  if (token != nullptr && *token != '\0') {
    config.waqi_token = token;
  }
}

ServiceConfig loadServiceConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("config: could not open " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  Json::Value root = JsonFields::parse(buffer.str());
  if (!root.isObject()) {
    throw std::runtime_error("config: top level of " + path + " must be an object");
  }

  ServiceConfig config;

  const Json::Value& server = section(root, "server");
  readString(server, "server", "listen_address", config.listen_address);
  long long port = config.port;
  readCount(server, "server", "port", port);
  if (port <= 0 || port > 65535) throw std::runtime_error("config: server.port out of range");
  config.port = static_cast<int>(port);
  long long chunk = static_cast<long long>(config.chunk_size);
  readCount(server, "server", "chunk_size", chunk);
  if (chunk == 0) throw std::runtime_error("config: server.chunk_size must be positive");
  config.chunk_size = static_cast<size_t>(chunk);

  const Json::Value& cache = section(root, "cache");
  readMillis(cache, "cache", "ttl_ms", config.cache_ttl);
  long long max_entries = static_cast<long long>(config.cache_max_entries);
  readCount(cache, "cache", "max_entries", max_entries);
  config.cache_max_entries = static_cast<size_t>(max_entries);
  readMillis(cache, "cache", "sweep_interval_ms", config.cache_sweep_interval);

  const Json::Value& debounce = section(root, "debounce");
  readMillis(debounce, "debounce", "delay_ms", config.debounce_delay);
  readMillis(debounce, "debounce", "max_wait_ms", config.debounce_max_wait);

  const Json::Value& merge = section(root, "merge");
  readNumber(merge, "merge", "epsilon_deg", config.dedup_epsilon_deg);
  readBool(merge, "merge", "short_circuit", config.fallback_policy.short_circuit);
  readNumber(merge, "merge", "short_circuit_ratio", config.fallback_policy.short_circuit_ratio);

  const Json::Value& cluster = section(root, "cluster");
  readNumber(cluster, "cluster", "size_km", config.cluster_size_km);

  const Json::Value& query = section(root, "query");
  long long default_limit = config.default_limit;
  readCount(query, "query", "default_limit", default_limit);
  if (default_limit == 0 || default_limit > INT_MAX) {
    throw std::runtime_error("config: query.default_limit must be a positive int");
  }
  config.default_limit = static_cast<int>(default_limit);
  readNumber(query, "query", "default_radius_km", config.default_radius_km);
  if (!std::isfinite(config.default_radius_km) || config.default_radius_km <= 0) {
    throw std::runtime_error("config: query.default_radius_km must be positive");
  }
  readNumber(query, "query", "single_station_radius_km", config.single_station_radius_km);
  if (!std::isfinite(config.single_station_radius_km) || config.single_station_radius_km <= 0) {
    throw std::runtime_error("config: query.single_station_radius_km must be positive");
  }

  const Json::Value& sources = section(root, "sources");
  if (sources.isMember("order")) {
    if (!sources["order"].isArray()) throw typeError("sources", "order", "an array of strings");
    config.source_order.clear();
    for (const auto& entry : sources["order"]) {
      if (!entry.isString()) throw typeError("sources", "order", "an array of strings");
      config.source_order.push_back(entry.asString());
    }
  }
  readMillis(sources, "sources", "timeout_ms", config.source_timeout);
  readString(sources, "sources", "doe_url", config.doe_url);
  readString(sources, "sources", "waqi_url", config.waqi_url);
  readString(sources, "sources", "waqi_token", config.waqi_token);
  readString(sources, "sources", "snapshot_csv", config.snapshot_csv);

  applyEnvironmentOverrides(config);
  return config;
}

std::vector<std::shared_ptr<SourceAdapter>> buildSourceAdapters(const ServiceConfig& config) {
  std::vector<std::shared_ptr<SourceAdapter>> adapters;
  std::set<std::string> seen;
  auto http = std::make_shared<HttpClient>(config.source_timeout);

  for (const auto& source : config.source_order) {
    if (!seen.insert(source).second) {
      throw std::runtime_error("config: source '" + source + "' listed twice");
    }

    if (source == "doe") {
      adapters.push_back(std::make_shared<DoeFeedAdapter>(http, config.doe_url));
    } else if (source == "waqi") {
      adapters.push_back(std::make_shared<WaqiFeedAdapter>(http, config.waqi_token, config.waqi_url));
    } else if (source == "snapshot") {
      if (config.snapshot_csv.empty()) {
        throw std::runtime_error("config: source 'snapshot' needs sources.snapshot_csv");
      }
      adapters.push_back(std::make_shared<CsvStationAdapter>(config.snapshot_csv));
    } else {
      throw std::runtime_error("config: unknown source '" + source + "'");
    }
  }

  if (adapters.empty()) {
    throw std::runtime_error("config: sources.order is empty");
  }
  return adapters;
}

void printServiceConfig(const ServiceConfig& config) {
  std::cout << "----------------------------------------" << std::endl;
  std::cout << " Configuration:" << std::endl;
  std::cout << "   Listen: " << config.listen_address << ":" << config.port << std::endl;
  std::cout << "   Chunking: " << config.chunk_size << " stations per chunk" << std::endl;
  std::cout << "   Cache TTL: " << config.cache_ttl.count() << "ms, sweep above "
            << config.cache_max_entries << " entries" << std::endl;
  std::cout << "   Debounce: " << config.debounce_delay.count() << "ms (max wait "
            << config.debounce_max_wait.count() << "ms)" << std::endl;
  std::cout << "   Dedup epsilon: " << config.dedup_epsilon_deg << " deg" << std::endl;
  std::cout << "   Fallback short-circuit: "
            << (config.fallback_policy.short_circuit ? "on" : "off")
            << " at " << config.fallback_policy.short_circuit_ratio << " of limit" << std::endl;
  std::cout << "   Cluster size: " << config.cluster_size_km << "km" << std::endl;
  std::cout << "   Sources:";
  for (const auto& source : config.source_order) {
    std::cout << " " << source;
  }
  std::cout << " (timeout " << config.source_timeout.count() << "ms)" << std::endl;
  std::cout << "----------------------------------------" << std::endl;
}
