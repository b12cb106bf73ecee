#ifndef COMMON_UTILS_HPP
#define COMMON_UTILS_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <grpcpp/grpcpp.h>
#include "airgeo.grpc.pb.h"
#include "airgeo.pb.h"
#include "StationTypes.hpp"

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;
using airgeo::StationChunk;
using airgeo::StationData;

/**
 * Chunked result state kept between GetNextChunk calls
 */
struct ChunkedRequest {
  std::deque<StationChunk> chunks;
  int current_chunk_index = 0;
  std::chrono::steady_clock::time_point last_access;

  ChunkedRequest() : last_access(std::chrono::steady_clock::now()) {}
};

class CommonUtils {
public:
  /**
   * Generate unique request ID with server prefix
   */
  static std::string generateRequestId(const std::string& prefix) {
    static std::atomic<int> counter(0);
    return prefix + "_" + std::to_string(++counter);
  }

  /**
   * Convert a normalized Station to protobuf StationData.
   * Absent readings stay unset on the wire.
   */
  static StationData convertToProtobuf(const Station& station) {
    StationData data;
    data.set_id(station.id);
    data.set_name(station.name);
    data.set_location(station.location);
    if (station.city) data.set_city(*station.city);
    if (station.country) data.set_country(*station.country);
    if (station.state) data.set_state(*station.state);
    if (station.region) data.set_region(*station.region);
    data.set_latitude(station.lat);
    data.set_longitude(station.lng);
    if (station.aqi) data.set_aqi(*station.aqi);
    if (station.pm25) data.set_pm25(*station.pm25);
    if (station.no2) data.set_no2(*station.no2);
    if (station.co) data.set_co(*station.co);
    if (station.o3) data.set_o3(*station.o3);
    if (station.so2) data.set_so2(*station.so2);
    if (station.lastUpdated) data.set_last_updated(*station.lastUpdated);
    data.set_source(sourceName(station.source));
    if (station.distance) data.set_distance_km(*station.distance);
    if (station.aqiClass) data.set_aqi_class(*station.aqiClass);
    if (station.category) data.set_category(*station.category);
    return data;
  }

  static airgeo::AreaSummary convertToProtobuf(const AreaSummary& summary) {
    airgeo::AreaSummary data;
    data.set_center_lat(summary.centerLat);
    data.set_center_lng(summary.centerLng);
    data.set_radius_km(summary.radiusKm);
    data.set_total_stations(summary.totalStations);
    data.set_average_aqi(summary.averageAQI);
    data.set_highest_aqi(summary.highestAQI);
    data.set_lowest_aqi(summary.lowestAQI);
    return data;
  }

  static airgeo::StationCluster convertToProtobuf(const StationCluster& cluster) {
    airgeo::StationCluster data;
    data.set_id(cluster.id);
    data.set_center_lat(cluster.centerLat);
    data.set_center_lng(cluster.centerLng);
    data.set_count(cluster.count);
    data.set_average_aqi(cluster.averageAQI);
    for (const auto& station : cluster.stations) {
      data.add_station_ids(station.id);
    }
    return data;
  }

  /**
   * Split a search response into chunks of chunk_size stations.
   * The first chunk carries the summary, clusters and source counts; an
   * empty result still yields one chunk.
   */
  static std::deque<StationChunk> buildChunks(const SearchResponse& response,
                                              const std::string& request_id,
                                              size_t chunk_size) {
    std::deque<StationChunk> chunks;
    const std::vector<Station>& stations = response.data;

    for (size_t start_idx = 0; start_idx < stations.size(); start_idx += chunk_size) {
      StationChunk chunk;
      chunk.set_request_id(request_id);
      chunk.set_success(response.success);

      size_t end_idx = std::min(start_idx + chunk_size, stations.size());
      for (size_t i = start_idx; i < end_idx; ++i) {
        *chunk.add_stations() = convertToProtobuf(stations[i]);
      }

      chunk.set_has_more_chunks(end_idx < stations.size());
      chunks.push_back(std::move(chunk));
    }

    if (chunks.empty()) {
      StationChunk empty_chunk;
      empty_chunk.set_request_id(request_id);
      empty_chunk.set_success(response.success);
      empty_chunk.set_has_more_chunks(false);
      chunks.push_back(std::move(empty_chunk));
    }

    StationChunk& first = chunks.front();
    if (response.error) first.set_error(*response.error);
    first.set_sources_queried(response.sourcesQueried);
    first.set_sources_failed(response.sourcesFailed);
    if (response.summary) {
      *first.mutable_summary() = convertToProtobuf(*response.summary);
      if (response.summary->clusters) {
        for (const auto& cluster : *response.summary->clusters) {
          *first.add_clusters() = convertToProtobuf(cluster);
        }
      }
    }

    return chunks;
  }
};

/**
 * Periodic cleanup of expired requests/sessions
 */
class CleanupManager {
private:
  std::thread cleanup_thread_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool running_;
  std::chrono::milliseconds cleanup_interval_;

public:
  explicit CleanupManager(std::chrono::milliseconds interval = std::chrono::minutes(5))
    : running_(true), cleanup_interval_(interval) {}

  virtual ~CleanupManager() {
    stop();
  }

  void start() {
    cleanup_thread_ = std::thread(&CleanupManager::cleanupLoop, this);
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
    }
    wake_.notify_all();
    if (cleanup_thread_.joinable()) {
      cleanup_thread_.join();
    }
  }

protected:
  virtual void cleanupExpiredItems() = 0;

private:
  void cleanupLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      wake_.wait_for(lock, cleanup_interval_, [this] { return !running_; });
      if (!running_) break;

      lock.unlock();
      cleanupExpiredItems();
      lock.lock();
    }
  }
};

/**
 * Holds the remaining chunks of area results until the client drains them,
 * cancels, or leaves them idle past the expiry.
 */
class ChunkingManager {
private:
  std::mutex mutex_;
  std::unordered_map<std::string, ChunkedRequest> chunked_requests_;
  std::chrono::milliseconds expiry_;
  std::unique_ptr<CleanupManager> cleanup_manager_;

public:
  explicit ChunkingManager(std::chrono::milliseconds expiry = std::chrono::minutes(30),
                           std::chrono::milliseconds interval = std::chrono::minutes(5))
    : expiry_(expiry) {
    class ChunkCleanup : public CleanupManager {
    private:
      ChunkingManager* parent_;
    public:
      ChunkCleanup(ChunkingManager* parent, std::chrono::milliseconds interval)
        : CleanupManager(interval), parent_(parent) {}
      ~ChunkCleanup() override { stop(); }
    protected:
      void cleanupExpiredItems() override {
        parent_->cleanupExpiredRequests();
      }
    };

    cleanup_manager_ = std::make_unique<ChunkCleanup>(this, interval);
    cleanup_manager_->start();
  }

  ~ChunkingManager() {
    cleanup_manager_->stop();
  }

  /**
   * Store chunked request data; the first chunk is considered delivered
   */
  void storeChunks(const std::string& request_id, std::deque<StationChunk> chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkedRequest req_state;
    req_state.chunks = std::move(chunks);
    req_state.current_chunk_index = 0;
    chunked_requests_[request_id] = std::move(req_state);
  }

  /**
   * Get next chunk for a request
   */
  Status getNextChunk(const std::string& request_id, StationChunk* reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = chunked_requests_.find(request_id);
    if (it == chunked_requests_.end()) {
      return Status(grpc::NOT_FOUND, "Request ID not found");
    }

    ChunkedRequest& req_state = it->second;
    req_state.last_access = std::chrono::steady_clock::now();

    if (req_state.current_chunk_index + 1 >= static_cast<int>(req_state.chunks.size())) {
      return Status(grpc::OUT_OF_RANGE, "No more chunks available");
    }

    req_state.current_chunk_index++;
    *reply = req_state.chunks[req_state.current_chunk_index];

    return Status::OK;
  }

  /**
   * Cancel a request
   */
  void cancelRequest(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    chunked_requests_.erase(request_id);
  }

  size_t activeRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunked_requests_.size();
  }

  void cleanupExpiredRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();

    for (auto it = chunked_requests_.begin(); it != chunked_requests_.end(); ) {
      if (now - it->second.last_access > expiry_) {
        it = chunked_requests_.erase(it);
      } else {
        ++it;
      }
    }
  }
};

#endif
