#include "StationClusterer.hpp"
#include "AqiAggregator.hpp"
#include "GeoMath.hpp"

std::vector<StationCluster> StationClusterer::clusterStations(const std::vector<Station>& stations,
                                                              double cluster_size_km) {
  std::vector<StationCluster> clusters;
  std::vector<bool> processed(stations.size(), false);

  for (size_t seed = 0; seed < stations.size(); ++seed) {
    if (processed[seed]) continue;

    StationCluster cluster;
    double sumLat = 0.0;
    double sumLng = 0.0;

    for (size_t i = seed; i < stations.size(); ++i) {
      if (processed[i]) continue;

      double distance = GeoMath::haversineDistanceKm(stations[seed].lat, stations[seed].lng,
                                                     stations[i].lat, stations[i].lng);
      if (distance > cluster_size_km) continue;

      processed[i] = true;
      sumLat += stations[i].lat;
      sumLng += stations[i].lng;
      cluster.stations.push_back(stations[i]);
    }

    cluster.id = "cluster-" + std::to_string(clusters.size());
    cluster.count = static_cast<int>(cluster.stations.size());
    cluster.centerLat = sumLat / cluster.count;
    cluster.centerLng = sumLng / cluster.count;
    cluster.averageAQI = AqiAggregator::averageAQI(cluster.stations);
    clusters.push_back(std::move(cluster));
  }

  return clusters;
}
