#include <climits>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include "CSVParser.hpp"
#include "CsvStationAdapter.hpp"
#include "TestSupport.hpp"

namespace {

std::string writeTempFile(const std::string &name, const std::string &contents) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

} // namespace

int main() {
    std::cout << "=== CSV Snapshot Test ===" << std::endl;
    printSeparator();

    std::cout << "\n[TEST 1] Line parsing..." << std::endl;
    auto fields = CSVParser::parseLine(R"(7,"Klang, Selangor", Port ,"say ""hi""",)");
    check(fields.size() == 5, "five fields including the trailing empty one");
    check(fields[1] == "Klang, Selangor", "quoted comma kept inside the field");
    check(fields[2] == "Port", "unquoted field trimmed");
    check(fields[3] == "say \"hi\"", "doubled quotes unescaped");
    check(fields[4].empty(), "trailing empty field");
    check(CSVParser::parseLine("a,b\r").back() == "b", "carriage return dropped");
    check(CSVParser::isSkippable("   ") && CSVParser::isSkippable("# comment"), "blank and comment lines skipped");
    auto header = CSVParser::headerIndex({"ID", " Lat ", "lng"});
    check(header.at("id") == 0 && header.at("lat") == 1 && header.at("lng") == 2, "header names normalized");
    printSeparator();

    std::cout << "\n[TEST 2] Loading a snapshot..." << std::endl;
    std::string path = writeTempFile("airgeo_snapshot_test.csv",
        "# exported station snapshot\n"
        "id,name,location,city,country,lat,lng,aqi,pm25,no2,co,o3,so2,last_updated\n"
        "1,Cheras,\"Cheras, KL\",Kuala Lumpur,Malaysia,3.106,101.718,62,62,,,,,2024-05-01T10:00:00Z\n"
        "2,Batu Muda,Batu Muda,Kuala Lumpur,Malaysia,3.212,101.682,,,,,,,\n"
        "3,Broken,Broken,,,not-a-number,101.0,10,,,,,,\n"
        "4,Outside,Outside,,,95.0,101.0,10,,,,,,\n"
        "\n"
        "5,Penang,Georgetown,Penang,Malaysia,5.414,100.329,45,,,,,,\n");
    CsvStationAdapter adapter(path);
    check(adapter.isLoaded(), "snapshot loaded");
    check(adapter.getStationCount() == 3, "bad and out-of-range rows skipped");

    FetchResult all = adapter.fetchByBounds({6.0, 3.0, 102.0, 100.0}, 100);
    check(all.ok && all.stations.size() == 3, "bounds covering everything returns all");
    const Station &cheras = all.stations[0];
    check(cheras.id == "snapshot-1" && cheras.source == SourceId::Snapshot, "id prefixed with snapshot-");
    check(cheras.location == "Cheras, KL" && cheras.country.value_or("") == "Malaysia", "text columns carried");
    check(cheras.aqi.value_or(0) == 62 && !cheras.no2.has_value(), "empty readings stay absent");
    check(cheras.lastUpdated.value_or("") == "2024-05-01T10:00:00Z", "timestamp carried");
    check(!all.stations[1].aqi.has_value(), "station without AQI kept");
    printSeparator();

    std::cout << "\n[TEST 3] Spatial queries..." << std::endl;
    FetchResult kl = adapter.fetchByRadius({3.139, 101.6869}, 15.0, 10);
    check(kl.ok && kl.stations.size() == 2, "two Kuala Lumpur stations within 15 km");
    bool distancesSet = true;
    for (const auto &s : kl.stations) {
        if (!s.distance || *s.distance > 15.0) distancesSet = false;
    }
    check(distancesSet, "radius results carry their distance");
    check(adapter.fetchByBounds({6.0, 3.0, 102.0, 100.0}, 1).stations.size() == 1, "limit honoured");
    check(adapter.fetchByBounds({1.0, 0.0, 1.0, 0.0}, 10).stations.empty(), "empty area is an empty success");

    FetchResult wide = adapter.fetchByRadius({3.139, 101.6869}, 50.0, 100);
    FetchResult huge = adapter.fetchByRadius({3.139, 101.6869}, 50.0, INT_MAX / 2 + 1);
    check(wide.stations.size() == 5, "every snapshot station within 50 km");
    check(huge.ok && huge.stations.size() == wide.stations.size(),
          "very large limit returns as many stations as a small one");
    check(SourceAdapter::overFetchLimit(100) == 200, "over-fetch doubles the limit");
    check(SourceAdapter::overFetchLimit(INT_MAX) == INT_MAX, "over-fetch saturates at INT_MAX");

    FetchResult network = adapter.fetchAll(100);
    check(network.ok && network.stations.size() == 5, "fetchAll returns the whole snapshot");
    check(adapter.fetchAll(2).stations.size() == 2, "fetchAll honours the limit");
    printSeparator();

    std::cout << "\n[TEST 4] Missing file and bad header..." << std::endl;
    CsvStationAdapter missing("/nonexistent/airgeo/stations.csv");
    check(!missing.isLoaded(), "missing file not loaded");
    FetchResult failed = missing.fetchByBounds({6.0, 3.0, 102.0, 100.0}, 10);
    check(!failed.ok && failed.error.find("snapshot unavailable") != std::string::npos,
          "fetch from missing snapshot is a failure");
    check(missing.health().failures == 1, "failure recorded");

    std::string badHeader = writeTempFile("airgeo_bad_header.csv", "name,latitude,longitude\nA,1,2\n");
    CsvStationAdapter wrongColumns(badHeader);
    check(!wrongColumns.isLoaded(), "header without id/lat/lng rejected");

    std::remove(path.c_str());
    std::remove(badHeader.c_str());
    return finish("CSV Snapshot");
}
