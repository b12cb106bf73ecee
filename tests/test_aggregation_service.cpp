#include <chrono>
#include <climits>
#include <cmath>
#include <limits>
#include <memory>
#include <thread>
#include <vector>
#include "StationAggregationService.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;

namespace {

const GeoPoint KL{3.139, 101.6869};

ServiceConfig testConfig() {
    ServiceConfig config;
    config.debounce_delay = 40ms;
    config.debounce_max_wait = 400ms;
    return config;
}

// Three stations 2, 5 and 8 km north of KL plus one 12 km away on the diagonal
std::vector<Station> klStations() {
    return {
        makeStation("doe-8km", KL.lat + 0.0719, KL.lng, 80.0),
        makeStation("doe-2km", KL.lat + 0.0180, KL.lng, 40.0),
        makeStation("doe-5km", KL.lat + 0.0450, KL.lng, 60.0),
        makeStation("doe-far", KL.lat + 0.0764, KL.lng + 0.0764, 150.0)};
}

// 2, 4 and 5 km due north of KL (AQI 40, 60, 80) and one 12 km north (AQI 100)
std::vector<Station> klNorthStations() {
    const double kmPerDegree = GeoMath::EARTH_RADIUS_KM * GeoMath::PI / 180.0;
    return {
        makeStation("doe-2", KL.lat + 2.0 / kmPerDegree, KL.lng, 40.0),
        makeStation("doe-12", KL.lat + 12.0 / kmPerDegree, KL.lng, 100.0),
        makeStation("doe-5", KL.lat + 5.0 / kmPerDegree, KL.lng, 80.0),
        makeStation("doe-4", KL.lat + 4.0 / kmPerDegree, KL.lng, 60.0)};
}

std::vector<std::shared_ptr<SourceAdapter>> adapterList(const std::shared_ptr<FakeAdapter> &a,
                                                        const std::shared_ptr<FakeAdapter> &b) {
    return {a, b};
}

template <typename Fn>
bool throwsInvalidQuery(Fn fn) {
    try {
        fn();
    } catch (const InvalidQueryError &e) {
        std::cout << "    rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "=== StationAggregationService Test ===" << std::endl;
    printSeparator();

    std::cout << "\n[TEST 1] Kuala Lumpur radius scenario..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        doe->radiusAsBox = true;
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        SearchResponse response = service.fetchByRadius(KL, 10.0);
        check(response.success, "query succeeded");
        check(response.data.size() == 3, "three stations inside 10 km");
        bool farExcluded = true;
        bool inside = true;
        for (const auto &s : response.data) {
            if (s.id == "doe-far") farExcluded = false;
            if (!s.distance || *s.distance > 10.0) inside = false;
        }
        check(farExcluded, "12 km station excluded");
        check(inside, "every station within the radius with distance set");
        check(response.data[0].id == "doe-2km" && response.data[2].id == "doe-8km", "sorted nearest first");
        check(response.summary.has_value(), "summary present");
        check(response.summary->averageAQI == 60 && response.summary->highestAQI == 80 &&
              response.summary->lowestAQI == 40, "avg 60, max 80, min 40");
        check(response.summary->totalStations == 3 && response.summary->radiusKm == 10.0,
              "summary totals and radius");
        check(!response.summary->clusters.has_value(), "no clusters unless requested");
        check(response.sourcesQueried == 2 && response.sourcesFailed == 0, "primary under half the limit asked the fallback");

        RadiusQueryOptions limited;
        limited.limit = 2;
        response = service.fetchByRadius(KL, 10.0, limited);
        check(response.data.size() == 2 && response.data[0].id == "doe-2km", "limit caps the result");

        RadiusQueryOptions huge;
        huge.limit = INT_MAX;
        response = service.fetchByRadius(KL, 10.0, huge);
        check(response.success && response.data.size() == 3, "INT_MAX limit returns every station");

        SearchResponse nothing = service.fetchByRadius({-33.9, 18.4}, 10.0);
        check(nothing.success && nothing.data.empty(), "empty area is an empty success");
        check(nothing.summary && nothing.summary->averageAQI == 0, "empty summary averages 0");
    }
    printSeparator();

    std::cout << "\n[TEST 2] Stations at 2, 4, 5 and 12 km..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klNorthStations());
        doe->radiusAsBox = true;
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        SearchResponse response = service.fetchByRadius(KL, 10.0);
        check(response.success && response.data.size() == 3, "three stations within 10 km");
        check(response.data.size() == 3 && response.data[0].id == "doe-2" &&
              response.data[1].id == "doe-4" && response.data[2].id == "doe-5", "ordered 2, 4, 5 km");
        if (response.data.size() == 3) {
            checkNear(*response.data[0].distance, 2.0, 0.01, "first station 2 km away");
            checkNear(*response.data[1].distance, 4.0, 0.01, "second station 4 km away");
            checkNear(*response.data[2].distance, 5.0, 0.01, "third station 5 km away");
        }
        bool twelveExcluded = true;
        for (const auto &s : response.data) {
            if (s.id == "doe-12") twelveExcluded = false;
        }
        check(twelveExcluded, "12 km station left out");
        check(response.summary && response.summary->totalStations == 3 &&
              response.summary->averageAQI == 60 && response.summary->highestAQI == 80 &&
              response.summary->lowestAQI == 40, "totalStations 3, average 60, highest 80, lowest 40");
    }
    printSeparator();

    std::cout << "\n[TEST 3] Cached adapter results..." << std::endl;
    {
        ServiceConfig config = testConfig();
        config.cache_ttl = 150ms;
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), config);

        service.fetchByRadius(KL, 10.0);
        service.fetchByRadius({KL.lat + 0.0001, KL.lng - 0.0001}, 10.0);
        check(doe->radiusCalls.load() == 1, "second call within rounding tolerance served from cache");
        check(waqi->radiusCalls.load() == 1, "fallback result cached as well");

        service.fetchByRadius({KL.lat + 0.01, KL.lng}, 10.0);
        check(doe->radiusCalls.load() == 2, "different area misses the cache");

        std::this_thread::sleep_for(250ms);
        service.fetchByRadius(KL, 10.0);
        check(doe->radiusCalls.load() == 3, "expired entry triggers a fresh fetch");

        CacheReport report = service.getCacheStats();
        check(report.hits >= 2 && report.misses >= 4, "hits and misses reported");
        check(report.keys.size() == report.size && report.size > 0, "keys listed");
        check(report.keys[0].rfind("doe-", 0) == 0 || report.keys[0].rfind("waqi-", 0) == 0,
              "keys named after the adapter");

        service.clearCache();
        check(service.getCacheStats().size == 0, "clearCache empties the cache");
        service.fetchByRadius(KL, 10.0);
        check(doe->radiusCalls.load() == 4, "cleared cache refetches");

        doe->failing = true;
        service.fetchByRadius({10.0, 10.0}, 5.0);
        service.fetchByRadius({10.0, 10.0}, 5.0);
        check(doe->radiusCalls.load() == 6, "failed fetches are not cached");
    }
    printSeparator();

    std::cout << "\n[TEST 4] Fallback merge and short-circuit..." << std::endl;
    {
        std::vector<Station> primary = {makeStation("doe-1", 3.1000, 101.7000, 50.0, SourceId::Doe)};
        std::vector<Station> fallback = {makeStation("waqi-dup", 3.1004, 101.7004, 55.0, SourceId::Waqi),
                                         makeStation("waqi-2", 3.1200, 101.7000, 70.0, SourceId::Waqi)};

        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, primary);
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, fallback);
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        RadiusQueryOptions two;
        two.limit = 2;
        SearchResponse response = service.fetchByRadius({3.1, 101.7}, 10.0, two);
        check(waqi->radiusCalls.load() == 0, "primary at half the limit short-circuits the fallback");
        check(response.sourcesQueried == 1 && response.data.size() == 1, "only the primary answered");

        response = service.fetchByRadius({3.1, 101.7}, 10.0);
        check(waqi->radiusCalls.load() == 1, "primary below half the limit asks the fallback");
        check(response.data.size() == 2, "co-located fallback station deduplicated");
        bool primaryKept = false;
        bool duplicateDropped = true;
        for (const auto &s : response.data) {
            if (s.id == "doe-1") primaryKept = true;
            if (s.id == "waqi-dup") duplicateDropped = false;
        }
        check(primaryKept && duplicateDropped, "primary copy wins");

        ServiceConfig always = testConfig();
        always.fallback_policy.short_circuit = false;
        auto doe2 = std::make_shared<FakeAdapter>(SourceId::Doe, primary);
        auto waqi2 = std::make_shared<FakeAdapter>(SourceId::Waqi, fallback);
        StationAggregationService eager(adapterList(doe2, waqi2), always);
        response = eager.fetchByRadius({3.1, 101.7}, 10.0, two);
        check(waqi2->radiusCalls.load() == 1, "disabled short-circuit always asks the fallback");
        check(response.data.size() == 2 && response.sourcesQueried == 2, "fallback fills up to the limit");
    }
    printSeparator();

    std::cout << "\n[TEST 5] Primary outage..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        doe->failing = true;
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi,
            std::vector<Station>{makeStation("waqi-kl", KL.lat, KL.lng + 0.01, 90.0, SourceId::Waqi)});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        SearchResponse response = service.fetchByRadius(KL, 10.0);
        check(response.success, "query still succeeds");
        check(response.data.size() == 1 && response.data[0].id == "waqi-kl", "fallback stations returned");
        check(response.sourcesQueried == 2 && response.sourcesFailed == 1, "failure counted");

        waqi->failing = true;
        response = service.fetchByRadius({KL.lat + 1, KL.lng}, 10.0);
        check(response.success && response.data.empty() && response.sourcesFailed == 2,
              "all sources down is an empty result with failures counted");
    }
    printSeparator();

    std::cout << "\n[TEST 6] Invalid queries are rejected before any fetch..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());
        const double nan = std::numeric_limits<double>::quiet_NaN();

        check(throwsInvalidQuery([&] { service.fetchByRadius({91.0, 0.0}, 10.0); }), "latitude 91");
        check(throwsInvalidQuery([&] { service.fetchByRadius({0.0, 181.0}, 10.0); }), "longitude 181");
        check(throwsInvalidQuery([&] { service.fetchByRadius({nan, 0.0}, 10.0); }), "NaN latitude");
        check(throwsInvalidQuery([&] { service.fetchByRadius(KL, 0.0); }), "zero radius");
        check(throwsInvalidQuery([&] { service.fetchByRadius(KL, -5.0); }), "negative radius");
        check(throwsInvalidQuery([&] { service.fetchByRadius(KL, nan); }), "NaN radius");
        RadiusQueryOptions zeroLimit;
        zeroLimit.limit = 0;
        check(throwsInvalidQuery([&] { service.fetchByRadius(KL, 10.0, zeroLimit); }), "zero limit");
        check(throwsInvalidQuery([&] { service.fetchByBounds({3.0, 4.0, 102.0, 101.0}); }), "north below south");
        check(throwsInvalidQuery([&] { service.fetchByBounds({4.0, 3.0, 101.0, 102.0}); }), "east below west");
        check(throwsInvalidQuery([&] { service.getSingleStation({0.0, 200.0}); }), "single station off the map");
        check(doe->totalCalls() == 0 && waqi->totalCalls() == 0, "no adapter was called");

        bool threw = false;
        try {
            StationAggregationService empty({}, testConfig());
        } catch (const std::invalid_argument &) {
            threw = true;
        }
        check(threw, "service without adapters rejected");
    }
    printSeparator();

    std::cout << "\n[TEST 7] Bounding-box queries and clustering..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        BoundingBox box{3.3, 3.0, 101.9, 101.5};
        BoundsQueryOptions options;
        options.clustering = true;
        SearchResponse response = service.fetchByBounds(box, options);
        check(response.success && response.data.size() == 4, "every station in the box");
        check(doe->boundsCalls.load() == 1 && doe->radiusCalls.load() == 0, "bounds fetch used");
        check(response.summary.has_value(), "summary present");
        checkNear(response.summary->centerLat, 3.15, 1e-9, "summary centered on the box centroid latitude");
        checkNear(response.summary->centerLng, 101.7, 1e-9, "summary centered on the box centroid longitude");
        checkNear(response.summary->radiusKm, GeoMath::coveringRadiusKm(box), 1e-9, "covering radius");
        check(response.summary->averageAQI == 83, "average over all four stations");
        check(response.summary->clusters.has_value(), "clusters attached when requested");

        size_t clustered = 0;
        for (const auto &c : *response.summary->clusters) clustered += c.stations.size();
        check(clustered == 4, "each station in exactly one cluster");

        RadiusQueryOptions radiusClusters;
        radiusClusters.clustering = true;
        radiusClusters.cluster_size_km = 1.0;
        response = service.fetchByRadius(KL, 10.0, radiusClusters);
        check(response.summary->clusters && response.summary->clusters->size() == 3,
              "1 km clusters keep the three stations apart");

        auto clusters = service.clusterStations(klStations());
        check(!clusters.empty() && clusters[0].id == "cluster-0", "clusterStations exposed on the service");
    }
    {
        BoundingBox box{3.2, 3.0, 101.8, 101.6};
        std::vector<Station> primary = {makeStation("doe-1", 3.1000, 101.7000, 50.0, SourceId::Doe)};
        std::vector<Station> fallback = {makeStation("waqi-dup", 3.1004, 101.7004, 55.0, SourceId::Waqi),
                                         makeStation("waqi-2", 3.1500, 101.7500, 70.0, SourceId::Waqi)};

        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, primary);
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, fallback);
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        BoundsQueryOptions two;
        two.limit = 2;
        SearchResponse response = service.fetchByBounds(box, two);
        check(waqi->boundsCalls.load() == 0, "bounds: primary at half the limit short-circuits the fallback");
        check(response.sourcesQueried == 1 && response.data.size() == 1, "bounds: only the primary answered");

        response = service.fetchByBounds(box);
        check(waqi->boundsCalls.load() == 1, "bounds: primary below half the limit asks the fallback");
        check(response.data.size() == 2 && response.sourcesQueried == 2, "bounds: fallback station added");
        bool primaryKept = false;
        bool duplicateDropped = true;
        for (const auto &s : response.data) {
            if (s.id == "doe-1") primaryKept = true;
            if (s.id == "waqi-dup") duplicateDropped = false;
        }
        check(primaryKept && duplicateDropped, "bounds: co-located fallback station deduplicated");

        doe->failing = true;
        waqi->failing = true;
        BoundingBox elsewhere{5.2, 5.0, 101.8, 101.6};
        response = service.fetchByBounds(elsewhere);
        check(response.success && response.data.empty(), "bounds: every source down is an empty success");
        check(response.sourcesQueried == 2 && response.sourcesFailed == 2, "bounds: both failures counted");
        check(response.summary && response.summary->totalStations == 0, "bounds: empty summary");
    }
    printSeparator();

    std::cout << "\n[TEST 8] Single-station lookups..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe,
            std::vector<Station>{makeStation("doe-here", 3.5, 101.5, 33.0)});
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        auto found = service.getSingleStation({3.5, 101.5});
        check(found.has_value() && found->id == "doe-here", "station at the point found");
        check(waqi->radiusCalls.load() == 0, "one primary hit satisfies the lookup");

        SingleStationLookup near = service.lookupSingleStation({3.5005, 101.5});
        check(near.outcome == LookupOutcome::Found, "station 55 m away is within 100 m");

        SingleStationLookup none = service.lookupSingleStation({3.51, 101.5});
        check(none.outcome == LookupOutcome::NotFound && !none.station, "nothing within 100 m is not found");
        check(!service.getSingleStation({3.51, 101.5}).has_value(), "getSingleStation returns nullopt");

        doe->failing = true;
        waqi->failing = true;
        SingleStationLookup down = service.lookupSingleStation({4.0, 102.0});
        check(down.outcome == LookupOutcome::SourcesUnavailable, "every source failing is unavailable");
    }
    printSeparator();

    std::cout << "\n[TEST 9] Debounced radius queries..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, klStations());
        doe->delay = 20ms;
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        RadiusQueryOptions debounced;
        debounced.debounce = true;
        std::vector<SearchResponse> results(6);
        std::vector<std::thread> callers;
        for (size_t i = 0; i < results.size(); ++i) {
            callers.emplace_back([&, i]() {
                results[i] = service.fetchByRadius(KL, 10.0, debounced);
            });
        }
        for (auto &t : callers) t.join();

        check(doe->radiusCalls.load() == 1, "six simultaneous callers, one upstream fetch");
        bool identical = true;
        for (const auto &r : results) {
            if (!r.success || r.data.size() != results[0].data.size() ||
                r.summary->averageAQI != results[0].summary->averageAQI) {
                identical = false;
            }
        }
        check(identical, "every caller received the same response");

        const GeoPoint nearby{KL.lat + 0.0001, KL.lng};
        SearchResponse fromKl;
        SearchResponse fromNearby;
        std::thread first([&]() { fromKl = service.fetchByRadius(KL, 10.0, debounced); });
        std::thread second([&]() { fromNearby = service.fetchByRadius(nearby, 10.0, debounced); });
        first.join();
        second.join();

        bool ownDistances = !fromNearby.data.empty() && !fromKl.data.empty();
        for (const auto &s : fromNearby.data) {
            double expected = GeoMath::haversineDistanceKm(nearby.lat, nearby.lng, s.lat, s.lng);
            if (!s.distance || std::fabs(*s.distance - expected) > 1e-9) ownDistances = false;
        }
        for (const auto &s : fromKl.data) {
            double expected = GeoMath::haversineDistanceKm(KL.lat, KL.lng, s.lat, s.lng);
            if (!s.distance || std::fabs(*s.distance - expected) > 1e-9) ownDistances = false;
        }
        check(ownDistances, "callers 11 m apart are not coalesced; each gets distances from its own center");
    }
    printSeparator();

    std::cout << "\n[TEST 10] Tracking options and priority..." << std::endl;
    {
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, std::vector<Station>{});
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, std::vector<Station>{});
        StationAggregationService service(adapterList(waqi, doe), testConfig());

        TrackingOptions defaults = service.getTrackingOptions();
        check(defaults.enabled && defaults.radiusKm == 100 && defaults.updateIntervalMs == 5000,
              "tracking defaults");
        check(defaults.debounceDelayMs == 1000 && defaults.maxStations == 50 &&
              defaults.clustering && defaults.clusterSizeKm == 5, "tracking defaults continued");

        TrackingOverrides overrides;
        overrides.radiusKm = 25.0;
        overrides.clustering = false;
        TrackingOptions custom = service.getTrackingOptions(overrides);
        check(custom.radiusKm == 25 && !custom.clustering && custom.maxStations == 50,
              "overrides applied over defaults");

        check(service.priorityOrder().size() == 2 && service.priorityOrder()[0] == SourceId::Waqi,
              "priority follows adapter order");
    }

    printSeparator();

    std::cout << "\n[TEST 11] Whole-network listing..." << std::endl;
    {
        std::vector<Station> primary = {makeStation("doe-kl", 3.1, 101.7, 40.0, SourceId::Doe),
                                        makeStation("doe-penang", 5.4, 100.3, 80.0, SourceId::Doe)};
        std::vector<Station> fallback = {makeStation("waqi-dup", 3.1004, 101.7004, 45.0, SourceId::Waqi),
                                         makeStation("waqi-jb", 1.5, 103.7, 60.0, SourceId::Waqi)};
        auto doe = std::make_shared<FakeAdapter>(SourceId::Doe, primary);
        auto waqi = std::make_shared<FakeAdapter>(SourceId::Waqi, fallback);
        StationAggregationService service(adapterList(doe, waqi), testConfig());

        SearchResponse response = service.fetchAllStations();
        check(response.success && response.data.size() == 3, "every station in the network, duplicate merged");
        check(response.data.size() == 3 && response.data[0].id == "doe-kl" &&
              response.data[1].id == "doe-penang",
              "primary stations listed first");
        check(response.sourcesQueried == 2, "fallback asked when the primary is under half the limit");
        check(response.summary && response.summary->totalStations == 3 &&
              response.summary->averageAQI == 60 && response.summary->highestAQI == 80 &&
              response.summary->lowestAQI == 40, "network summary");
        checkNear(response.summary->centerLat, (5.4 + 1.5) / 2, 1e-9, "summary centered on the station extent");

        service.fetchAllStations();
        check(doe->boundsCalls.load() == 1 && waqi->boundsCalls.load() == 1, "second listing served from cache");

        AllStationsQueryOptions one;
        one.limit = 1;
        one.clustering = true;
        response = service.fetchAllStations(one);
        check(response.data.size() == 1 && waqi->boundsCalls.load() == 1, "limit 1 satisfied by the primary alone");
        check(response.summary->clusters && response.summary->clusters->size() == 1, "clusters on request");

        AllStationsQueryOptions none;
        none.limit = 0;
        check(throwsInvalidQuery([&] { service.fetchAllStations(none); }), "zero limit rejected");

        doe->failing = true;
        waqi->failing = true;
        service.clearCache();
        response = service.fetchAllStations();
        check(response.success && response.data.empty() && response.sourcesFailed == 2,
              "network down is an empty success");
    }

    return finish("StationAggregationService");
}
