#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "GeoMath.hpp"
#include "HttpClient.hpp"
#include "SourceAdapter.hpp"

static int g_failures = 0;

inline void printSeparator() {
    std::cout << "================================================" << std::endl;
}

inline void check(bool condition, const std::string &what) {
    if (condition) {
        std::cout << "✓ " << what << std::endl;
    } else {
        std::cout << "✗ " << what << std::endl;
        g_failures++;
    }
}

inline void checkNear(double actual, double expected, double tolerance, const std::string &what) {
    bool ok = std::fabs(actual - expected) <= tolerance;
    if (!ok) {
        std::cout << "    expected " << expected << " got " << actual << std::endl;
    }
    check(ok, what);
}

inline int finish(const std::string &suite) {
    printSeparator();
    if (g_failures == 0) {
        std::cout << "=== " << suite << ": ALL TESTS PASSED ===" << std::endl;
        return 0;
    }
    std::cout << "=== " << suite << ": " << g_failures << " CHECK(S) FAILED ===" << std::endl;
    return 1;
}

inline Station makeStation(const std::string &id, double lat, double lng,
                           std::optional<double> aqi, SourceId source = SourceId::Doe) {
    Station s;
    s.id = id;
    s.name = id;
    s.location = id;
    s.lat = lat;
    s.lng = lng;
    s.aqi = aqi;
    s.source = source;
    return s;
}

/**
 * In-memory source with call counting. Radius fetches return the stations
 * inside the circle (or its enclosing box when radiusAsBox is set, like a
 * real feed), bounds fetches those inside the box.
 */
class FakeAdapter : public SourceAdapter {
public:
    FakeAdapter(SourceId id, std::vector<Station> stations)
        : id(id), stations(std::move(stations)) {}

    SourceId sourceId() const override { return id; }
    std::string name() const override { return "Fake-" + sourceName(id); }

    FetchResult fetchByRadius(const GeoPoint &center, double radiusKm, int limit) override {
        radiusCalls++;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (failing) return FetchResult::failure("fake outage");

        FetchResult result;
        BoundingBox box = GeoMath::boundingBoxFromRadius(center, radiusKm);
        for (const auto &s : stations) {
            bool inside = radiusAsBox
                ? GeoMath::containsPoint(box, s.lat, s.lng)
                : GeoMath::haversineDistanceKm(center.lat, center.lng, s.lat, s.lng) <= radiusKm;
            if (inside) {
                result.stations.push_back(s);
            }
            if (static_cast<int>(result.stations.size()) >= limit) break;
        }
        return result;
    }

    FetchResult fetchByBounds(const BoundingBox &bbox, int limit) override {
        boundsCalls++;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (failing) return FetchResult::failure("fake outage");

        FetchResult result;
        for (const auto &s : stations) {
            if (GeoMath::containsPoint(bbox, s.lat, s.lng)) {
                result.stations.push_back(s);
            }
            if (static_cast<int>(result.stations.size()) >= limit) break;
        }
        return result;
    }

    int totalCalls() const { return radiusCalls.load() + boundsCalls.load(); }

    SourceId id;
    std::vector<Station> stations;
    std::atomic<bool> failing{false};
    bool radiusAsBox = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> radiusCalls{0};
    std::atomic<int> boundsCalls{0};
};

/**
 * Serves one canned response and remembers the requested URLs
 */
class FakeHttpClient : public HttpClient {
public:
    FakeHttpClient() : HttpClient(std::chrono::milliseconds(1000)) {}

    HttpResponse get(const std::string &url) override {
        std::lock_guard<std::mutex> lock(mtx);
        urls.push_back(url);
        return response;
    }

    void respond(int status, const std::string &body) {
        std::lock_guard<std::mutex> lock(mtx);
        response = HttpResponse();
        response.status_code = status;
        response.body = body;
    }

    void failTransport(const std::string &error) {
        std::lock_guard<std::mutex> lock(mtx);
        response = HttpResponse();
        response.error = error;
    }

    std::vector<std::string> urls;
    HttpResponse response;
    std::mutex mtx;
};

#endif // TEST_SUPPORT_HPP
