#include "GeoMath.hpp"
#include <algorithm>
#include <cmath>

namespace GeoMath {

double toRadians(double degrees) {
  return degrees * PI / 180.0;
}

double haversineDistanceKm(double lat1, double lng1, double lat2, double lng2) {
  double dLat = toRadians(lat2 - lat1);
  double dLng = toRadians(lng2 - lng1);

  double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
             std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
             std::sin(dLng / 2) * std::sin(dLng / 2);
  double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
  return EARTH_RADIUS_KM * c;
}

double haversineDistanceKm(const GeoPoint& a, const GeoPoint& b) {
  return haversineDistanceKm(a.lat, a.lng, b.lat, b.lng);
}

BoundingBox boundingBoxFromRadius(const GeoPoint& center, double radiusKm) {
  double clampedLat = std::clamp(center.lat, -MAX_BBOX_LATITUDE, MAX_BBOX_LATITUDE);

  double latDelta = radiusKm / KM_PER_DEGREE_LAT;
  double lngDelta = radiusKm / (KM_PER_DEGREE_LAT * std::cos(toRadians(clampedLat)));

  BoundingBox bbox;
  bbox.north = center.lat + latDelta;
  bbox.south = center.lat - latDelta;
  bbox.east = center.lng + lngDelta;
  bbox.west = center.lng - lngDelta;
  return bbox;
}

GeoPoint boundingBoxCenter(const BoundingBox& bbox) {
  GeoPoint center;
  center.lat = (bbox.north + bbox.south) / 2;
  center.lng = (bbox.east + bbox.west) / 2;
  return center;
}

double coveringRadiusKm(const BoundingBox& bbox) {
  GeoPoint center = boundingBoxCenter(bbox);
  return haversineDistanceKm(center.lat, center.lng, bbox.north, bbox.east);
}

bool containsPoint(const BoundingBox& bbox, double lat, double lng) {
  return lat >= bbox.south && lat <= bbox.north &&
         lng >= bbox.west && lng <= bbox.east;
}

bool isValidCoordinate(double lat, double lng) {
  if (!std::isfinite(lat) || !std::isfinite(lng)) {
    return false;
  }
  return lat >= -90.0 && lat <= 90.0 && lng >= -180.0 && lng <= 180.0;
}

bool isValidBoundingBox(const BoundingBox& bbox) {
  if (!isValidCoordinate(bbox.north, bbox.east) ||
      !isValidCoordinate(bbox.south, bbox.west)) {
    return false;
  }
  return bbox.north > bbox.south && bbox.east > bbox.west;
}

} // namespace GeoMath
