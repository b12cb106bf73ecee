#ifndef STATION_CLUSTERER_HPP
#define STATION_CLUSTERER_HPP

#include <vector>
#include "StationTypes.hpp"

/**
 * Greedy single-pass clustering for map pins.
 *
 * Stations are visited in input order; each unprocessed station seeds a
 * cluster that absorbs every unprocessed station within cluster_size_km of
 * the seed. Membership at cluster boundaries depends on input order.
 */
class StationClusterer {
public:
  static constexpr double DEFAULT_CLUSTER_SIZE_KM = 5.0;

  static std::vector<StationCluster> clusterStations(const std::vector<Station>& stations,
                                                     double cluster_size_km = DEFAULT_CLUSTER_SIZE_KM);
};

#endif // STATION_CLUSTERER_HPP
