#ifndef STATION_MERGER_HPP
#define STATION_MERGER_HPP

#include <vector>
#include "StationTypes.hpp"

struct SourceResult {
  SourceId source;
  std::vector<Station> stations;
};

/**
 * When enabled, lower-priority sources are skipped once the primary alone
 * returned at least ceil(ratio * limit) stations.
 */
struct FallbackPolicy {
  bool short_circuit = true;
  double short_circuit_ratio = 0.5;
};

class StationMerger {
public:
  static constexpr double DEFAULT_EPSILON_DEG = 0.001;

  /**
   * Merge per-source results under a priority order.
   *
   * Every station of the highest-priority source is kept. A station from a
   * later source is dropped when |dLat| < epsilon and |dLng| < epsilon against
   * any kept station, and is otherwise appended while the merged list is
   * shorter than limit. Sources missing from priority_order are ignored.
   *
   * The epsilon test is a coarse grid-cell identity: two distinct stations
   * closer than epsilon on both axes collapse into one, and one station
   * reported with coordinates drifting by more than epsilon is kept twice.
   */
  static std::vector<Station> mergeBySourcePriority(const std::vector<SourceId>& priority_order,
                                                    const std::vector<SourceResult>& results,
                                                    int limit,
                                                    double epsilon_deg = DEFAULT_EPSILON_DEG);

  static bool isDuplicate(const Station& a, const Station& b, double epsilon_deg);

  static bool shouldFetchFallback(size_t primary_count, int limit, const FallbackPolicy& policy);
};

#endif // STATION_MERGER_HPP
