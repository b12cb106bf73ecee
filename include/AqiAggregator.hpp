#ifndef AQI_AGGREGATOR_HPP
#define AQI_AGGREGATOR_HPP

#include <vector>
#include "StationTypes.hpp"

/**
 * Area statistics over a station list. Only stations with aqi > 0 take part
 * in average/highest/lowest; every station counts toward totalStations.
 * All results are finite, 0 when no station has a usable aqi.
 */
class AqiAggregator {
public:
  // Lists at least this long are reduced with OpenMP
  static constexpr int PARALLEL_THRESHOLD = 2048;

  // Rounded to the nearest integer, half up
  static double averageAQI(const std::vector<Station>& stations);
  static double highestAQI(const std::vector<Station>& stations);
  static double lowestAQI(const std::vector<Station>& stations);

  static AreaSummary summarize(double centerLat, double centerLng, double radiusKm,
                               const std::vector<Station>& stations);

private:
  static std::vector<double> validAqiValues(const std::vector<Station>& stations);
};

#endif // AQI_AGGREGATOR_HPP
