#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "airgeo.grpc.pb.h"
#include "airgeo.pb.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;
using airgeo::Ack;
using airgeo::AllStationsRequest;
using airgeo::BoundsRequest;
using airgeo::CacheStats;
using airgeo::CacheStatsRequest;
using airgeo::ChunkRequest;
using airgeo::ClearCacheRequest;
using airgeo::PointRequest;
using airgeo::RadiusRequest;
using airgeo::StationChunk;
using airgeo::StationData;
using airgeo::StationQuery;
using airgeo::StationReply;

const std::string DEFAULT_SERVER_ADDRESS = "localhost:50051";

class StationQueryClient
{
public:
  StationQueryClient(std::shared_ptr<Channel> channel)
      : stub_(StationQuery::NewStub(channel)) {}

  bool SearchByRadius(double lat, double lng, double radius_km, int limit, bool clustering)
  {
    RadiusRequest request;
    request.set_lat(lat);
    request.set_lng(lng);
    request.set_radius_km(radius_km);
    request.set_limit(limit);
    request.set_clustering(clustering);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Client: Radius search (" << lat << ", " << lng << ") r=" << radius_km << "km" << std::endl;
    std::cout << "========================================\n"
              << std::endl;

    StationChunk reply;
    ClientContext context;
    Status status = stub_->SearchByRadius(&context, request, &reply);
    return collectChunks(status, reply);
  }

  bool SearchByBounds(double north, double south, double east, double west, int limit, bool clustering)
  {
    BoundsRequest request;
    request.set_north(north);
    request.set_south(south);
    request.set_east(east);
    request.set_west(west);
    request.set_limit(limit);
    request.set_clustering(clustering);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Client: Bounds search N" << north << " S" << south << " E" << east << " W" << west << std::endl;
    std::cout << "========================================\n"
              << std::endl;

    StationChunk reply;
    ClientContext context;
    Status status = stub_->SearchByBounds(&context, request, &reply);
    return collectChunks(status, reply);
  }

  bool ListAllStations(int limit, bool clustering)
  {
    AllStationsRequest request;
    request.set_limit(limit);
    request.set_clustering(clustering);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Client: All stations (limit " << limit << ")" << std::endl;
    std::cout << "========================================\n"
              << std::endl;

    StationChunk reply;
    ClientContext context;
    Status status = stub_->ListAllStations(&context, request, &reply);
    return collectChunks(status, reply);
  }

  bool GetSingleStation(double lat, double lng)
  {
    PointRequest request;
    request.set_lat(lat);
    request.set_lng(lng);

    StationReply reply;
    ClientContext context;
    Status status = stub_->GetSingleStation(&context, request, &reply);

    if (!status.ok())
    {
      printError(status);
      return false;
    }

    std::cout << "✅ Client: Station found" << std::endl;
    displayStation(reply.station(), 0);
    return true;
  }

  bool PrintCacheStats()
  {
    CacheStatsRequest request;
    CacheStats reply;
    ClientContext context;
    Status status = stub_->GetCacheStats(&context, request, &reply);

    if (!status.ok())
    {
      printError(status);
      return false;
    }

    std::cout << "Cache entries: " << reply.size() << std::endl;
    std::cout << "Hits: " << reply.hits() << ", Misses: " << reply.misses()
              << ", Expired: " << reply.expirations() << std::endl;
    for (const auto &key : reply.keys())
    {
      std::cout << "  " << key << std::endl;
    }
    return true;
  }

  bool ClearCache()
  {
    ClearCacheRequest request;
    Ack reply;
    ClientContext context;
    Status status = stub_->ClearCache(&context, request, &reply);

    if (!status.ok())
    {
      printError(status);
      return false;
    }

    std::cout << "✅ Client: Cache cleared" << std::endl;
    return true;
  }

private:
  bool collectChunks(const Status &status, StationChunk &reply)
  {
    if (!status.ok())
    {
      printError(status);
      return false;
    }

    if (!reply.success())
    {
      std::cerr << "❌ Client: Query failed: " << reply.error() << std::endl;
      return false;
    }

    std::cout << "✅ Client: SUCCESS - Received first chunk" << std::endl;
    std::cout << "   Request ID: " << reply.request_id() << std::endl;
    std::cout << "   Sources: " << reply.sources_queried() << " queried, "
              << reply.sources_failed() << " failed" << std::endl;
    if (reply.has_summary())
    {
      const auto &summary = reply.summary();
      std::cout << "   Stations in area: " << summary.total_stations()
                << ", AQI avg " << summary.average_aqi()
                << " / max " << summary.highest_aqi()
                << " / min " << summary.lowest_aqi() << std::endl;
    }
    for (const auto &cluster : reply.clusters())
    {
      std::cout << "   " << cluster.id() << ": " << cluster.count() << " stations around ("
                << cluster.center_lat() << ", " << cluster.center_lng() << "), AQI "
                << cluster.average_aqi() << std::endl;
    }

    displayChunkData(reply, 1);

    int total_stations = reply.stations_size();
    int chunk_count = 1;
    std::string request_id = reply.request_id();

    while (reply.has_more_chunks())
    {
      chunk_count++;
      if (getNextChunk(request_id, reply))
      {
        total_stations += reply.stations_size();
        displayChunkData(reply, chunk_count);
      }
      else
      {
        std::cerr << "❌ Failed to get chunk " << chunk_count << std::endl;
        return false;
      }
    }

    std::cout << "\n========================================" << std::endl;
    std::cout << "✅ Client: Request Complete!" << std::endl;
    std::cout << "   Total chunks received: " << chunk_count << std::endl;
    std::cout << "   Total stations received: " << total_stations << std::endl;
    std::cout << "========================================\n"
              << std::endl;
    return true;
  }

  bool getNextChunk(const std::string &request_id, StationChunk &reply)
  {
    ChunkRequest chunk_req;
    chunk_req.set_request_id(request_id);

    ClientContext context;
    Status status = stub_->GetNextChunk(&context, chunk_req, &reply);

    return status.ok();
  }

  void displayChunkData(const StationChunk &chunk, int chunk_number)
  {
    std::cout << "\n--- Chunk " << chunk_number << " ---" << std::endl;
    std::cout << "Stations: " << chunk.stations_size() << std::endl;

    int display_count = std::min(3, chunk.stations_size());
    for (int i = 0; i < display_count; i++)
    {
      displayStation(chunk.stations(i), i);
    }

    if (chunk.stations_size() > 3)
    {
      std::cout << "  ... and " << (chunk.stations_size() - 3) << " more stations" << std::endl;
    }
  }

  void displayStation(const StationData &station, int index)
  {
    std::cout << "  [" << index << "] " << station.name() << " (" << station.source() << ")";

    if (station.has_aqi())
    {
      std::cout << ", AQI: " << station.aqi();
    }

    if (station.has_distance_km())
    {
      std::cout << ", " << station.distance_km() << "km away";
    }

    if (!station.last_updated().empty())
    {
      std::cout << ", Time: " << station.last_updated();
    }

    std::cout << std::endl;
  }

  void printError(const Status &status)
  {
    std::cerr << "❌ Client: Request failed!" << std::endl;
    std::cerr << "   Error code: " << status.error_code() << std::endl;
    std::cerr << "   Error message: " << status.error_message() << std::endl;
  }

  std::unique_ptr<StationQuery::Stub> stub_;
};

void printUsage(const char *program)
{
  std::cerr << "Usage: " << program << " [target] <mode> [args]" << std::endl;
  std::cerr << "  radius <lat> <lng> <radius_km> [limit] [cluster]" << std::endl;
  std::cerr << "  bounds <north> <south> <east> <west> [limit] [cluster]" << std::endl;
  std::cerr << "  all [limit] [cluster]" << std::endl;
  std::cerr << "  station <lat> <lng>" << std::endl;
  std::cerr << "  stats" << std::endl;
  std::cerr << "  clear" << std::endl;
}

int main(int argc, char **argv)
{
  std::string target_str = DEFAULT_SERVER_ADDRESS;
  int arg = 1;
  if (argc > 1 && std::string(argv[1]).find(':') != std::string::npos)
  {
    target_str = argv[1];
    arg = 2;
  }

  std::string mode = argc > arg ? argv[arg] : "radius";
  auto number = [&](int offset, double fallback) {
    return argc > arg + offset ? std::atof(argv[arg + offset]) : fallback;
  };

  std::cout << "========================================" << std::endl;
  std::cout << "Air Quality Station Query - Test Client" << std::endl;
  std::cout << "========================================" << std::endl;
  std::cout << "Connecting to: " << target_str << std::endl;

  StationQueryClient client(
      grpc::CreateChannel(target_str, grpc::InsecureChannelCredentials()));

  bool ok = false;
  if (mode == "radius")
  {
    bool clustering = argc > arg + 5 && std::string(argv[arg + 5]) == "cluster";
    ok = client.SearchByRadius(number(1, 3.139), number(2, 101.6869), number(3, 10.0),
                               static_cast<int>(number(4, 100)), clustering);
  }
  else if (mode == "bounds")
  {
    bool clustering = argc > arg + 6 && std::string(argv[arg + 6]) == "cluster";
    ok = client.SearchByBounds(number(1, 3.3), number(2, 2.9), number(3, 101.9), number(4, 101.5),
                               static_cast<int>(number(5, 100)), clustering);
  }
  else if (mode == "all")
  {
    bool clustering = argc > arg + 2 && std::string(argv[arg + 2]) == "cluster";
    ok = client.ListAllStations(static_cast<int>(number(1, 1000)), clustering);
  }
  else if (mode == "station")
  {
    ok = client.GetSingleStation(number(1, 3.139), number(2, 101.6869));
  }
  else if (mode == "stats")
  {
    ok = client.PrintCacheStats();
  }
  else if (mode == "clear")
  {
    ok = client.ClearCache();
  }
  else
  {
    printUsage(argv[0]);
    return 2;
  }

  return ok ? 0 : 1;
}
