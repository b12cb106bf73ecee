#include "StationMerger.hpp"
#include <cmath>

std::vector<Station> StationMerger::mergeBySourcePriority(const std::vector<SourceId>& priority_order,
                                                          const std::vector<SourceResult>& results,
                                                          int limit,
                                                          double epsilon_deg) {
  std::vector<Station> merged;

  for (size_t rank = 0; rank < priority_order.size(); ++rank) {
    SourceId source = priority_order[rank];

    for (const auto& result : results) {
      if (result.source != source) continue;

      if (rank == 0) {
        merged.insert(merged.end(), result.stations.begin(), result.stations.end());
        continue;
      }

      for (const auto& candidate : result.stations) {
        if (static_cast<int>(merged.size()) >= limit) break;

        bool duplicate = false;
        for (const auto& kept : merged) {
          if (isDuplicate(kept, candidate, epsilon_deg)) {
            duplicate = true;
            break;
          }
        }
        if (!duplicate) {
          merged.push_back(candidate);
        }
      }
    }
  }

  return merged;
}

bool StationMerger::isDuplicate(const Station& a, const Station& b, double epsilon_deg) {
  return std::fabs(a.lat - b.lat) < epsilon_deg && std::fabs(a.lng - b.lng) < epsilon_deg;
}

bool StationMerger::shouldFetchFallback(size_t primary_count, int limit, const FallbackPolicy& policy) {
  if (!policy.short_circuit) {
    return true;
  }
  double threshold = std::ceil(policy.short_circuit_ratio * limit);
  return static_cast<double>(primary_count) < threshold;
}
