#include "SourceAdapter.hpp"
#include "GeoMath.hpp"
#include <climits>

FetchResult SourceAdapter::radiusFromBounds(const GeoPoint& center, double radiusKm, int limit) {
  BoundingBox bbox = GeoMath::boundingBoxFromRadius(center, radiusKm);

  // The box is a superset of the circle, fetch extra to survive the filter
  FetchResult boxed = fetchByBounds(bbox, overFetchLimit(limit));
  if (!boxed.ok) {
    return boxed;
  }

  FetchResult result;
  for (auto& station : boxed.stations) {
    double distance = GeoMath::haversineDistanceKm(center.lat, center.lng,
                                                   station.lat, station.lng);
    if (distance > radiusKm) continue;

    station.distance = distance;
    result.stations.push_back(std::move(station));
    if (static_cast<int>(result.stations.size()) >= limit) break;
  }
  return result;
}

int SourceAdapter::overFetchLimit(int limit) {
  return limit > INT_MAX / 2 ? INT_MAX : limit * 2;
}

FetchResult SourceAdapter::fetchAll(int limit) {
  BoundingBox world;
  world.north = 90.0;
  world.south = -90.0;
  world.east = 180.0;
  world.west = -180.0;
  return fetchByBounds(world, limit);
}
