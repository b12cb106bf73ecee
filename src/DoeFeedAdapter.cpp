#include "DoeFeedAdapter.hpp"
#include "GeoMath.hpp"
#include "JsonFields.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

Station stationFromAttributes(const Json::Value& attrs, double lat, double lng) {
  Station station;
  station.id = "doe-" + JsonFields::idString(attrs["STATION_ID"]);

  auto location = JsonFields::text(attrs, "STATION_LOCATION");
  station.name = location.value_or("DOE Station");
  station.location = location.value_or("Unknown Location");
  station.city = JsonFields::text(attrs, "PLACE");
  station.country = std::string("Malaysia");
  station.lat = lat;
  station.lng = lng;
  station.aqi = JsonFields::number(attrs, "API");

  // The feed reports one index value plus the pollutant that drove it
  auto param = JsonFields::text(attrs, "PARAM_SELECTED");
  if (param && station.aqi) {
    if (*param == "PM2.5") station.pm25 = station.aqi;
    else if (*param == "NO2") station.no2 = station.aqi;
    else if (*param == "CO") station.co = station.aqi;
    else if (*param == "O3") station.o3 = station.aqi;
    else if (*param == "SO2") station.so2 = station.aqi;
  }

  auto datetime = JsonFields::number(attrs, "DATETIME");
  if (datetime) {
    station.lastUpdated = JsonFields::isoFromEpochMillis(static_cast<long long>(*datetime));
  }

  station.source = SourceId::Doe;
  station.aqiClass = JsonFields::text(attrs, "CLASS");
  station.category = JsonFields::text(attrs, "STATION_CATEGORY");
  station.state = JsonFields::text(attrs, "STATE_NAME");
  station.region = JsonFields::text(attrs, "REGION_NAME");
  return station;
}

} // namespace

DoeFeedAdapter::DoeFeedAdapter(std::shared_ptr<HttpClient> http, const std::string& query_url)
    : http_(std::move(http)), query_url_(query_url) {}

FetchResult DoeFeedAdapter::fetchByRadius(const GeoPoint& center, double radiusKm, int limit) {
  return radiusFromBounds(center, radiusKm, limit);
}

FetchResult DoeFeedAdapter::fetchByBounds(const BoundingBox& bbox, int limit) {
  return fetchQuery(buildBoundsUrl(bbox), limit);
}

FetchResult DoeFeedAdapter::fetchAll(int limit) {
  return fetchQuery(buildAllStationsUrl(), limit);
}

FetchResult DoeFeedAdapter::fetchQuery(const std::string& url, int limit) {
  FetchResult result;

  try {
    HttpResponse response = http_->get(url);

    if (!response.error.empty()) {
      result = FetchResult::failure("transport error: " + response.error);
    } else if (!response.ok()) {
      result = FetchResult::failure("HTTP " + std::to_string(response.status_code));
    } else {
      result.stations = parseFeatures(response.body, limit);
      std::cout << "DoeFeedAdapter: Got " << result.stations.size() << " stations ("
                << static_cast<long long>(response.elapsed_ms) << "ms)" << std::endl;
    }
  } catch (const std::exception& e) {
    result = FetchResult::failure(e.what());
  }

  if (!result.ok) {
    std::cerr << "DoeFeedAdapter: Fetch failed: " << result.error << std::endl;
  }
  recordOutcome(result);
  return result;
}

std::string DoeFeedAdapter::buildBoundsUrl(const BoundingBox& bbox) const {
  std::ostringstream where;
  where << std::setprecision(10)
        << "LATITUDE > " << bbox.south << " AND LATITUDE < " << bbox.north
        << " AND LONGITUDE > " << bbox.west << " AND LONGITUDE < " << bbox.east;

  return query_url_ + "?f=json&outFields=*&returnGeometry=false&where=" +
         HttpClient::urlEncode(where.str());
}

std::string DoeFeedAdapter::buildAllStationsUrl() const {
  return query_url_ + "?f=json&outFields=*&returnGeometry=false"
                      "&spatialRel=esriSpatialRelIntersects&where=" + HttpClient::urlEncode("1=1");
}

std::vector<Station> DoeFeedAdapter::parseFeatures(const std::string& body, int limit) {
  Json::Value root = JsonFields::parse(body);

  if (root.isObject() && root.isMember("error")) {
    std::string message = JsonFields::text(root["error"], "message").value_or("unknown");
    throw std::runtime_error("ArcGIS error: " + message);
  }
  if (!root.isObject() || !root["features"].isArray()) {
    throw std::runtime_error("Response has no features array");
  }

  std::vector<Station> stations;
  for (const auto& feature : root["features"]) {
    const Json::Value& attrs = feature["attributes"];
    if (!attrs.isObject()) continue;

    auto lat = JsonFields::number(attrs, "LATITUDE");
    auto lng = JsonFields::number(attrs, "LONGITUDE");
    // Zero coordinates are placeholders for unlocated stations
    if (!lat || !lng || *lat == 0.0 || *lng == 0.0) continue;
    if (!GeoMath::isValidCoordinate(*lat, *lng)) continue;

    stations.push_back(stationFromAttributes(attrs, *lat, *lng));
    if (static_cast<int>(stations.size()) >= limit) break;
  }
  return stations;
}
