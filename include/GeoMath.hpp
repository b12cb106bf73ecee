#ifndef GEO_MATH_HPP
#define GEO_MATH_HPP

#include "StationTypes.hpp"

namespace GeoMath {

constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS_KM = 6371.0;
constexpr double KM_PER_DEGREE_LAT = 111.0;

// Beyond this latitude cos() is clamped so longitude deltas stay finite
constexpr double MAX_BBOX_LATITUDE = 85.0;

double toRadians(double degrees);

/**
 * Great-circle distance in kilometers (haversine formula)
 */
double haversineDistanceKm(double lat1, double lng1, double lat2, double lng2);
double haversineDistanceKm(const GeoPoint& a, const GeoPoint& b);

/**
 * Planar approximation of the rectangle enclosing a circle.
 * Does not handle wraparound across +/-180 degrees.
 */
BoundingBox boundingBoxFromRadius(const GeoPoint& center, double radiusKm);

GeoPoint boundingBoxCenter(const BoundingBox& bbox);

// Distance from the box centroid to its north-east corner
double coveringRadiusKm(const BoundingBox& bbox);

bool containsPoint(const BoundingBox& bbox, double lat, double lng);

bool isValidCoordinate(double lat, double lng);
bool isValidBoundingBox(const BoundingBox& bbox);

} // namespace GeoMath

#endif // GEO_MATH_HPP
