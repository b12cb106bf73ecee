#ifndef DOE_FEED_ADAPTER_HPP
#define DOE_FEED_ADAPTER_HPP

#include <memory>
#include <string>
#include "HttpClient.hpp"
#include "SourceAdapter.hpp"

/**
 * Primary feed: DOE continuous air quality monitoring, served as an ArcGIS
 * MapServer layer. Stations are selected with a WHERE clause on the
 * LATITUDE/LONGITUDE attributes.
 */
class DoeFeedAdapter : public SourceAdapter {
public:
  static constexpr const char* DEFAULT_QUERY_URL =
      "https://eqms.doe.gov.my/api3/publicmapproxy/PUBLIC_DISPLAY/"
      "CAQM_MCAQM_Current_Reading/MapServer/0/query";

  DoeFeedAdapter(std::shared_ptr<HttpClient> http,
                 const std::string& query_url = DEFAULT_QUERY_URL);

  SourceId sourceId() const override { return SourceId::Doe; }
  std::string name() const override { return "DoeFeedAdapter"; }

  FetchResult fetchByRadius(const GeoPoint& center, double radiusKm, int limit) override;
  FetchResult fetchByBounds(const BoundingBox& bbox, int limit) override;

  // Every station in the network (WHERE 1=1)
  FetchResult fetchAll(int limit) override;

  std::string buildBoundsUrl(const BoundingBox& bbox) const;
  std::string buildAllStationsUrl() const;

  /**
   * Parse an ArcGIS query response body into stations.
   * Throws std::runtime_error on malformed JSON or a service error object.
   */
  static std::vector<Station> parseFeatures(const std::string& body, int limit);

private:
  FetchResult fetchQuery(const std::string& url, int limit);

  std::shared_ptr<HttpClient> http_;
  std::string query_url_;
};

#endif // DOE_FEED_ADAPTER_HPP
