#include "CsvStationAdapter.hpp"
#include "GeoMath.hpp"
#include "CSVParser.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_map>

namespace {

using ColumnIndex = std::unordered_map<std::string, size_t>;

std::optional<std::string> cell(const std::vector<std::string> &fields,
                                const ColumnIndex &columns, const std::string &name) {
    auto it = columns.find(name);
    if (it == columns.end() || it->second >= fields.size() || fields[it->second].empty()) {
        return std::nullopt;
    }
    return fields[it->second];
}

// Throws std::invalid_argument / std::out_of_range on a bad number
std::optional<double> numericCell(const std::vector<std::string> &fields,
                                  const ColumnIndex &columns, const std::string &name) {
    auto value = cell(fields, columns, name);
    if (!value) return std::nullopt;
    return std::stod(*value);
}

} // namespace

CsvStationAdapter::CsvStationAdapter(const std::string &csvPath)
    : path(csvPath), loaded(false) {
    loaded = loadFromCSV(csvPath);
}

bool CsvStationAdapter::loadFromCSV(const std::string &filename) {
    std::ifstream file(filename);

    if (!file.is_open()) {
        loadError = "could not open " + filename;
        std::cerr << "CsvStationAdapter: Error: Could not open file " << filename << std::endl;
        return false;
    }

    std::string line;
    int lineNumber = 0;
    ColumnIndex columns;

    while (std::getline(file, line)) {
        lineNumber++;
        if (CSVParser::isSkippable(line)) continue;

        std::vector<std::string> fields = CSVParser::parseLine(line);

        if (columns.empty()) {
            columns = CSVParser::headerIndex(fields);
            if (!columns.count("lat") || !columns.count("lng") || !columns.count("id")) {
                loadError = "header must name id, lat and lng columns";
                std::cerr << "CsvStationAdapter: Error: " << loadError << " in " << filename << std::endl;
                return false;
            }
            continue;
        }

        try {
            Station station;
            station.id = "snapshot-" + cell(fields, columns, "id").value_or(std::to_string(lineNumber));
            station.name = cell(fields, columns, "name").value_or("Snapshot Station");
            station.location = cell(fields, columns, "location").value_or(station.name);
            station.city = cell(fields, columns, "city");
            station.country = cell(fields, columns, "country");

            auto lat = numericCell(fields, columns, "lat");
            auto lng = numericCell(fields, columns, "lng");
            if (!lat || !lng || !GeoMath::isValidCoordinate(*lat, *lng)) {
                std::cerr << "Warning: Invalid coordinates on line " << lineNumber
                          << " in " << filename << std::endl;
                continue;
            }
            station.lat = *lat;
            station.lng = *lng;

            station.aqi = numericCell(fields, columns, "aqi");
            station.pm25 = numericCell(fields, columns, "pm25");
            station.no2 = numericCell(fields, columns, "no2");
            station.co = numericCell(fields, columns, "co");
            station.o3 = numericCell(fields, columns, "o3");
            station.so2 = numericCell(fields, columns, "so2");
            station.lastUpdated = cell(fields, columns, "last_updated");
            station.source = SourceId::Snapshot;

            stations.push_back(station);
        } catch (const std::exception &e) {
            std::cerr << "Warning: Error parsing line " << lineNumber
                      << " in " << filename << ": " << e.what() << std::endl;
        }
    }

    if (columns.empty()) {
        loadError = "no header row in " + filename;
        std::cerr << "CsvStationAdapter: Error: " << loadError << std::endl;
        return false;
    }

    std::cout << "CsvStationAdapter: Loaded " << stations.size()
              << " stations from " << filename << std::endl;
    return true;
}

FetchResult CsvStationAdapter::fetchByRadius(const GeoPoint &center, double radiusKm, int limit) {
    return radiusFromBounds(center, radiusKm, limit);
}

FetchResult CsvStationAdapter::fetchByBounds(const BoundingBox &bbox, int limit) {
    FetchResult result;

    if (!loaded) {
        result = FetchResult::failure("snapshot unavailable: " + loadError);
        recordOutcome(result);
        return result;
    }

    for (const auto &station : stations) {
        if (!GeoMath::containsPoint(bbox, station.lat, station.lng)) continue;

        result.stations.push_back(station);
        if (static_cast<int>(result.stations.size()) >= limit) break;
    }

    recordOutcome(result);
    return result;
}
