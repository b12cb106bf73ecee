#include "WaqiFeedAdapter.hpp"
#include "GeoMath.hpp"
#include "JsonFields.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::optional<double> iaqiValue(const Json::Value& iaqi, const char* pollutant) {
  if (!iaqi.isObject() || !iaqi.isMember(pollutant)) {
    return std::nullopt;
  }
  return JsonFields::number(iaqi[pollutant], "v");
}

} // namespace

WaqiFeedAdapter::WaqiFeedAdapter(std::shared_ptr<HttpClient> http, const std::string& token,
                                 const std::string& bounds_url)
    : http_(std::move(http)), token_(token), bounds_url_(bounds_url) {
  if (token_.empty()) {
    std::cerr << "WaqiFeedAdapter: Warning: no API token configured, "
              << "requests will be rejected upstream" << std::endl;
  }
}

FetchResult WaqiFeedAdapter::fetchByRadius(const GeoPoint& center, double radiusKm, int limit) {
  return radiusFromBounds(center, radiusKm, limit);
}

FetchResult WaqiFeedAdapter::fetchByBounds(const BoundingBox& bbox, int limit) {
  FetchResult result;

  try {
    HttpResponse response = http_->get(buildBoundsUrl(bbox));

    if (!response.error.empty()) {
      result = FetchResult::failure("transport error: " + response.error);
    } else if (!response.ok()) {
      result = FetchResult::failure("HTTP " + std::to_string(response.status_code));
    } else {
      result.stations = parseStations(response.body, limit);
      std::cout << "WaqiFeedAdapter: Got " << result.stations.size() << " stations ("
                << static_cast<long long>(response.elapsed_ms) << "ms)" << std::endl;
    }
  } catch (const std::exception& e) {
    result = FetchResult::failure(e.what());
  }

  if (!result.ok) {
    std::cerr << "WaqiFeedAdapter: Fetch failed: " << result.error << std::endl;
  }
  recordOutcome(result);
  return result;
}

std::string WaqiFeedAdapter::buildBoundsUrl(const BoundingBox& bbox) const {
  std::ostringstream latlng;
  latlng << std::setprecision(10)
         << bbox.south << ',' << bbox.west << ',' << bbox.north << ',' << bbox.east;

  return bounds_url_ + "?latlng=" + HttpClient::urlEncode(latlng.str()) +
         "&networks=all&token=" + HttpClient::urlEncode(token_);
}

std::vector<Station> WaqiFeedAdapter::parseStations(const std::string& body, int limit) {
  Json::Value root = JsonFields::parse(body);

  auto status = JsonFields::text(root, "status");
  if (!status || *status != "ok") {
    std::string detail = root.isObject() && root["data"].isString()
        ? root["data"].asString() : status.value_or("missing status");
    throw std::runtime_error("WAQI status: " + detail);
  }
  if (!root["data"].isArray()) {
    throw std::runtime_error("WAQI response has no data array");
  }

  std::vector<Station> stations;
  for (const auto& entry : root["data"]) {
    if (!entry.isObject()) continue;

    auto lat = JsonFields::number(entry, "lat");
    auto lng = JsonFields::number(entry, "lon");
    auto aqi = JsonFields::number(entry, "aqi");
    if (!lat || !lng || !aqi) continue;
    if (!GeoMath::isValidCoordinate(*lat, *lng)) continue;

    const Json::Value& info = entry["station"];

    Station station;
    station.id = "waqi-" + JsonFields::idString(entry["uid"]);
    station.name = JsonFields::text(info, "name").value_or("WAQI Station");
    station.location = station.name;
    station.lat = *lat;
    station.lng = *lng;
    station.aqi = aqi;
    station.lastUpdated = JsonFields::text(info, "time");
    station.source = SourceId::Waqi;

    const Json::Value& iaqi = entry["iaqi"];
    station.pm25 = iaqiValue(iaqi, "pm25");
    station.no2 = iaqiValue(iaqi, "no2");
    station.co = iaqiValue(iaqi, "co");
    station.o3 = iaqiValue(iaqi, "o3");
    station.so2 = iaqiValue(iaqi, "so2");

    stations.push_back(std::move(station));
    if (static_cast<int>(stations.size()) >= limit) break;
  }
  return stations;
}
