#include "CacheStore.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

// Fixed-point thousandths; keeps -0.0004 and 0.0004 on the same key
long long roundThousandths(double value) {
  return std::llround(value * 1000.0);
}

} // namespace

std::string digestKey(const std::string& canonical) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : canonical) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }

  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << hash;
  return out.str();
}

std::string makeCacheKey(const std::string& adapter, const std::string& kind,
                         double lat, double lng, double radius_km, int limit) {
  std::ostringstream canonical;
  canonical << adapter << '|' << kind
            << '|' << roundThousandths(lat)
            << '|' << roundThousandths(lng)
            << '|' << roundThousandths(radius_km)
            << '|' << limit;
  return adapter + "-" + kind + "-" + digestKey(canonical.str());
}

std::string makeCacheKey(const std::string& adapter, const std::string& kind,
                         double north, double south, double east, double west,
                         int limit) {
  std::ostringstream canonical;
  canonical << adapter << '|' << kind
            << '|' << roundThousandths(north)
            << '|' << roundThousandths(south)
            << '|' << roundThousandths(east)
            << '|' << roundThousandths(west)
            << '|' << limit;
  return adapter + "-" + kind + "-" + digestKey(canonical.str());
}

std::string makeCacheKey(const std::string& adapter, const std::string& kind, int limit) {
  std::ostringstream canonical;
  canonical << adapter << '|' << kind << '|' << limit;
  return adapter + "-" + kind + "-" + digestKey(canonical.str());
}
