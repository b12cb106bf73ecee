#ifndef WAQI_FEED_ADAPTER_HPP
#define WAQI_FEED_ADAPTER_HPP

#include <memory>
#include <string>
#include "HttpClient.hpp"
#include "SourceAdapter.hpp"

/**
 * Fallback feed: World Air Quality Index map/bounds endpoint.
 * Entries whose aqi is "-" or otherwise non-numeric are dropped.
 */
class WaqiFeedAdapter : public SourceAdapter {
public:
  static constexpr const char* DEFAULT_BOUNDS_URL = "https://api.waqi.info/map/bounds";

  WaqiFeedAdapter(std::shared_ptr<HttpClient> http, const std::string& token,
                  const std::string& bounds_url = DEFAULT_BOUNDS_URL);

  SourceId sourceId() const override { return SourceId::Waqi; }
  std::string name() const override { return "WaqiFeedAdapter"; }

  FetchResult fetchByRadius(const GeoPoint& center, double radiusKm, int limit) override;
  FetchResult fetchByBounds(const BoundingBox& bbox, int limit) override;

  std::string buildBoundsUrl(const BoundingBox& bbox) const;

  // Throws std::runtime_error on malformed JSON or status != "ok"
  static std::vector<Station> parseStations(const std::string& body, int limit);

private:
  std::shared_ptr<HttpClient> http_;
  std::string token_;
  std::string bounds_url_;
};

#endif // WAQI_FEED_ADAPTER_HPP
