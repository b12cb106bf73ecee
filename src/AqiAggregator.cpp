#include "AqiAggregator.hpp"
#include <cmath>
#include <limits>

std::vector<double> AqiAggregator::validAqiValues(const std::vector<Station>& stations) {
  std::vector<double> values;
  values.reserve(stations.size());
  for (const auto& station : stations) {
    if (station.aqi && *station.aqi > 0) {
      values.push_back(*station.aqi);
    }
  }
  return values;
}

double AqiAggregator::averageAQI(const std::vector<Station>& stations) {
  std::vector<double> values = validAqiValues(stations);
  if (values.empty()) return 0;

  const int n = static_cast<int>(values.size());
  double sum = 0.0;

  #pragma omp parallel for reduction(+:sum) if(n >= PARALLEL_THRESHOLD)
  for (int i = 0; i < n; i++) {
    sum += values[i];
  }

  return std::floor(sum / n + 0.5);
}

double AqiAggregator::highestAQI(const std::vector<Station>& stations) {
  std::vector<double> values = validAqiValues(stations);
  const int n = static_cast<int>(values.size());
  double maxValue = -std::numeric_limits<double>::infinity();

  #pragma omp parallel for reduction(max:maxValue) if(n >= PARALLEL_THRESHOLD)
  for (int i = 0; i < n; i++) {
    if (values[i] > maxValue) {
      maxValue = values[i];
    }
  }

  return std::isfinite(maxValue) ? maxValue : 0.0;
}

double AqiAggregator::lowestAQI(const std::vector<Station>& stations) {
  std::vector<double> values = validAqiValues(stations);
  const int n = static_cast<int>(values.size());
  double minValue = std::numeric_limits<double>::infinity();

  #pragma omp parallel for reduction(min:minValue) if(n >= PARALLEL_THRESHOLD)
  for (int i = 0; i < n; i++) {
    if (values[i] < minValue) {
      minValue = values[i];
    }
  }

  return std::isfinite(minValue) ? minValue : 0.0;
}

AreaSummary AqiAggregator::summarize(double centerLat, double centerLng, double radiusKm,
                                     const std::vector<Station>& stations) {
  AreaSummary summary;
  summary.centerLat = centerLat;
  summary.centerLng = centerLng;
  summary.radiusKm = radiusKm;
  summary.totalStations = static_cast<int>(stations.size());
  summary.averageAQI = averageAQI(stations);
  summary.highestAQI = highestAQI(stations);
  summary.lowestAQI = lowestAQI(stations);
  summary.stations = stations;
  return summary;
}
