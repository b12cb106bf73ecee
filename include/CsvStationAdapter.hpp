#ifndef CSV_STATION_ADAPTER_HPP
#define CSV_STATION_ADAPTER_HPP

#include <string>
#include <vector>
#include "SourceAdapter.hpp"

/**
 * Serves a station snapshot loaded once from a CSV file.
 *
 * Expected header (order free, names case-insensitive):
 *   id,name,location,city,country,lat,lng,aqi,pm25,no2,co,o3,so2,last_updated
 * Empty cells mean "no reading". If the file cannot be loaded every fetch
 * reports failure so the snapshot behaves like an unreachable feed.
 */
class CsvStationAdapter : public SourceAdapter {
public:
    explicit CsvStationAdapter(const std::string &csvPath);

    SourceId sourceId() const override { return SourceId::Snapshot; }
    std::string name() const override { return "CsvStationAdapter"; }

    FetchResult fetchByRadius(const GeoPoint &center, double radiusKm, int limit) override;
    FetchResult fetchByBounds(const BoundingBox &bbox, int limit) override;

    bool isLoaded() const { return loaded; }
    size_t getStationCount() const { return stations.size(); }

private:
    bool loadFromCSV(const std::string &filename);

    std::string path;
    std::vector<Station> stations;
    bool loaded;
    std::string loadError;
};

#endif // CSV_STATION_ADAPTER_HPP
