#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>
#include "airgeo.grpc.pb.h"
#include "airgeo.pb.h"
#include "CommonUtils.hpp"
#include "ServiceConfig.hpp"
#include "StationAggregationService.hpp"

using airgeo::Ack;
using airgeo::AllStationsRequest;
using airgeo::BoundsRequest;
using airgeo::CacheStats;
using airgeo::CacheStatsRequest;
using airgeo::CancelRequestMessage;
using airgeo::ChunkRequest;
using airgeo::ClearCacheRequest;
using airgeo::PointRequest;
using airgeo::RadiusRequest;
using airgeo::StationQuery;
using airgeo::StationReply;

// Station query front end
// Runs area and point queries through the aggregation service and chunks the results
class StationQueryServiceImpl final : public StationQuery::Service
{
public:
  StationQueryServiceImpl(StationAggregationService& service, const ServiceConfig& config)
    : service_(service), config_(config), chunking_manager_(std::make_unique<ChunkingManager>()) {
    std::cout << "Aggregation Server: Initializing station query service..." << std::endl;
  }

  ~StationQueryServiceImpl() {
    std::cout << "\nAggregation Server: Shutting down..." << std::endl;
    printCacheStats(service_.getCacheStats());
  }

  Status SearchByRadius(ServerContext *context, const RadiusRequest *request,
                        StationChunk *reply) override {
    auto total_start = std::chrono::high_resolution_clock::now();
    std::string request_id = CommonUtils::generateRequestId("radius");

    std::cout << "\n========================================" << std::endl;
    std::cout << "Aggregation Server: Radius search (" << request->lat() << ", " << request->lng()
              << ") r=" << request->radius_km() << "km" << std::endl;
    std::cout << "Aggregation Server: Assigned Request ID: " << request_id << std::endl;
    std::cout << "========================================" << std::endl;

    RadiusQueryOptions options;
    options.limit = request->limit() > 0 ? request->limit() : config_.default_limit;
    options.debounce = request->debounce();
    options.clustering = request->clustering();
    if (request->cluster_size_km() > 0) {
      options.cluster_size_km = request->cluster_size_km();
    }
    double radius_km = request->radius_km() != 0 ? request->radius_km() : config_.default_radius_km;

    SearchResponse response;
    try {
      response = service_.fetchByRadius({request->lat(), request->lng()}, radius_km, options);
    } catch (const InvalidQueryError& e) {
      std::cerr << "Aggregation Server: Rejected radius search: " << e.what() << std::endl;
      return Status(grpc::INVALID_ARGUMENT, e.what());
    }

    return replyWithChunks(request_id, "radius", response, total_start, reply);
  }

  Status SearchByBounds(ServerContext *context, const BoundsRequest *request,
                        StationChunk *reply) override {
    auto total_start = std::chrono::high_resolution_clock::now();
    std::string request_id = CommonUtils::generateRequestId("bounds");

    std::cout << "\n========================================" << std::endl;
    std::cout << "Aggregation Server: Bounds search N" << request->north() << " S" << request->south()
              << " E" << request->east() << " W" << request->west() << std::endl;
    std::cout << "Aggregation Server: Assigned Request ID: " << request_id << std::endl;
    std::cout << "========================================" << std::endl;

    BoundingBox bbox;
    bbox.north = request->north();
    bbox.south = request->south();
    bbox.east = request->east();
    bbox.west = request->west();

    BoundsQueryOptions options;
    options.limit = request->limit() > 0 ? request->limit() : config_.default_limit;
    options.clustering = request->clustering();
    if (request->cluster_size_km() > 0) {
      options.cluster_size_km = request->cluster_size_km();
    }

    SearchResponse response;
    try {
      response = service_.fetchByBounds(bbox, options);
    } catch (const InvalidQueryError& e) {
      std::cerr << "Aggregation Server: Rejected bounds search: " << e.what() << std::endl;
      return Status(grpc::INVALID_ARGUMENT, e.what());
    }

    return replyWithChunks(request_id, "bounds", response, total_start, reply);
  }

  Status ListAllStations(ServerContext *context, const AllStationsRequest *request,
                         StationChunk *reply) override {
    auto total_start = std::chrono::high_resolution_clock::now();
    std::string request_id = CommonUtils::generateRequestId("all");

    std::cout << "\n========================================" << std::endl;
    std::cout << "Aggregation Server: All-stations listing" << std::endl;
    std::cout << "Aggregation Server: Assigned Request ID: " << request_id << std::endl;
    std::cout << "========================================" << std::endl;

    AllStationsQueryOptions options;
    if (request->limit() > 0) {
      options.limit = request->limit();
    }
    options.clustering = request->clustering();
    if (request->cluster_size_km() > 0) {
      options.cluster_size_km = request->cluster_size_km();
    }

    SearchResponse response;
    try {
      response = service_.fetchAllStations(options);
    } catch (const InvalidQueryError& e) {
      std::cerr << "Aggregation Server: Rejected all-stations listing: " << e.what() << std::endl;
      return Status(grpc::INVALID_ARGUMENT, e.what());
    }

    return replyWithChunks(request_id, "all", response, total_start, reply);
  }

  Status GetSingleStation(ServerContext *context, const PointRequest *request,
                          StationReply *reply) override {
    auto start = std::chrono::high_resolution_clock::now();

    SingleStationLookup lookup;
    try {
      lookup = service_.lookupSingleStation({request->lat(), request->lng()});
    } catch (const InvalidQueryError& e) {
      std::cerr << "Aggregation Server: Rejected station lookup: " << e.what() << std::endl;
      return Status(grpc::INVALID_ARGUMENT, e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start).count();

    switch (lookup.outcome) {
      case LookupOutcome::Found:
        *reply->mutable_station() = CommonUtils::convertToProtobuf(*lookup.station);
        std::cout << "Aggregation Server: Station lookup (" << request->lat() << ", " << request->lng()
                  << ") -> " << lookup.station->id << " (⏱️ " << duration << "ms)" << std::endl;
        return Status::OK;
      case LookupOutcome::SourcesUnavailable:
        std::cerr << "Aggregation Server: Station lookup failed, all sources unavailable" << std::endl;
        return Status(grpc::UNAVAILABLE, "Failed to fetch station data");
      case LookupOutcome::NotFound:
        break;
    }

    std::cout << "Aggregation Server: No station at (" << request->lat() << ", " << request->lng()
              << ") (⏱️ " << duration << "ms)" << std::endl;
    return Status(grpc::NOT_FOUND, "No station found at this location");
  }

  Status GetNextChunk(ServerContext *context, const ChunkRequest *request,
                      StationChunk *reply) override {
    auto start = std::chrono::high_resolution_clock::now();

    Status status = chunking_manager_->getNextChunk(request->request_id(), reply);

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        end - start).count();

    std::cout << "Aggregation Server: GetNextChunk for " << request->request_id()
              << " (⏱️ " << duration << "μs)" << std::endl;

    return status;
  }

  Status CancelRequest(ServerContext *context, const CancelRequestMessage *request,
                       Ack *reply) override {
    std::cout << "Aggregation Server: Cancel request: " << request->request_id() << std::endl;

    chunking_manager_->cancelRequest(request->request_id());

    reply->set_success(true);
    return Status::OK;
  }

  Status GetCacheStats(ServerContext *context, const CacheStatsRequest *request,
                       CacheStats *reply) override {
    CacheReport report = service_.getCacheStats();

    reply->set_size(static_cast<int32_t>(report.size));
    for (const auto& key : report.keys) {
      reply->add_keys(key);
    }
    reply->set_hits(static_cast<int64_t>(report.hits));
    reply->set_misses(static_cast<int64_t>(report.misses));
    reply->set_expirations(static_cast<int64_t>(report.expirations));

    printCacheStats(report);
    return Status::OK;
  }

  Status ClearCache(ServerContext *context, const ClearCacheRequest *request,
                    Ack *reply) override {
    std::cout << "Aggregation Server: Clearing cache" << std::endl;
    service_.clearCache();
    reply->set_success(true);
    return Status::OK;
  }

private:
  Status replyWithChunks(const std::string& request_id, const std::string& kind,
                         const SearchResponse& response,
                         std::chrono::high_resolution_clock::time_point total_start,
                         StationChunk* reply) {
    auto chunk_start = std::chrono::high_resolution_clock::now();
    std::deque<StationChunk> chunks = CommonUtils::buildChunks(response, request_id, config_.chunk_size);
    auto chunk_end = std::chrono::high_resolution_clock::now();

    chunking_manager_->storeChunks(request_id, chunks);
    *reply = chunks.front();

    auto total_end = std::chrono::high_resolution_clock::now();
    auto chunk_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        chunk_end - chunk_start).count();
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        total_end - total_start).count();

    printQueryMetrics(request_id, kind, response, chunks, chunk_time, total_time);
    return Status::OK;
  }

  void printQueryMetrics(const std::string& request_id, const std::string& kind,
                         const SearchResponse& response,
                         const std::deque<StationChunk>& chunks,
                         long long chunk_time, long long total_time) {
    std::cout << "\n========================================" << std::endl;
    std::cout << " AGGREGATION SERVER PERFORMANCE METRICS" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Request ID: " << request_id << std::endl;
    std::cout << "Query: " << kind << std::endl;
    std::cout << "----------------------------------------" << std::endl;
    if (!response.success) {
      std::cout << "❌ Query failed: " << response.error.value_or("unknown error") << std::endl;
    }
    std::cout << "  Sources queried: " << response.sourcesQueried
              << " (" << response.sourcesFailed << " failed)" << std::endl;
    std::cout << "  Chunking Time: " << chunk_time << "ms" << std::endl;
    std::cout << "  TOTAL TIME: " << total_time << "ms" << std::endl;
    std::cout << "----------------------------------------" << std::endl;
    std::cout << " Data Statistics:" << std::endl;
    std::cout << "   Total stations: " << response.data.size() << std::endl;
    std::cout << "   Total chunks: " << chunks.size() << std::endl;
    std::cout << "   Chunk size: " << config_.chunk_size << " stations" << std::endl;
    if (response.summary) {
      std::cout << "   Average AQI: " << response.summary->averageAQI
                << " (max " << response.summary->highestAQI
                << ", min " << response.summary->lowestAQI << ")" << std::endl;
      if (response.summary->clusters) {
        std::cout << "   Clusters: " << response.summary->clusters->size() << std::endl;
      }
    }
    std::cout << "========================================\n" << std::endl;
  }

  void printCacheStats(const CacheReport& report) {
    std::cout << "----------------------------------------" << std::endl;
    std::cout << " Cache Statistics:" << std::endl;
    std::cout << "   Entries: " << report.size << std::endl;
    std::cout << "   Hits: " << report.hits << std::endl;
    std::cout << "   Misses: " << report.misses << std::endl;
    std::cout << "   Expired: " << report.expirations << std::endl;
    uint64_t lookups = report.hits + report.misses;
    if (lookups > 0) {
      std::cout << "   Hit rate: " << (report.hits * 100.0 / lookups) << "%" << std::endl;
    }
    std::cout << "----------------------------------------" << std::endl;
  }

private:
  StationAggregationService& service_;
  const ServiceConfig& config_;
  std::unique_ptr<ChunkingManager> chunking_manager_;
};

void RunServer(const ServiceConfig& config) {
  std::string server_address(config.listen_address + ":" + std::to_string(config.port));

  StationAggregationService aggregation(buildSourceAdapters(config), config);
  StationQueryServiceImpl service(aggregation, config);

  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    throw std::runtime_error("could not listen on " + server_address);
  }

  std::cout << "\n========================================" << std::endl;
  std::cout << " Air Quality Aggregation Server" << std::endl;
  std::cout << "========================================" << std::endl;
  std::cout << "Listening on: " << server_address << std::endl;
  printServiceConfig(config);
  std::cout << "\nWaiting for requests..." << std::endl;

  server->Wait();
}

int main(int argc, char **argv) {
  std::cout << "Aggregation Server starting..." << std::endl;

  try {
    ServiceConfig config = argc > 1 ? loadServiceConfig(argv[1]) : defaultServiceConfig();
    RunServer(config);
  } catch (const std::exception& e) {
    std::cerr << "Aggregation Server: Fatal: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
