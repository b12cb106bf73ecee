#include "JsonFields.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace JsonFields {

Json::Value parse(const std::string& body) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
    throw std::runtime_error("Malformed JSON payload: " + errors);
  }
  return root;
}

std::optional<double> number(const Json::Value& object, const char* key) {
  if (!object.isObject() || !object.isMember(key)) {
    return std::nullopt;
  }

  const Json::Value& value = object[key];
  if (value.isNumeric()) {
    double d = value.asDouble();
    if (std::isfinite(d)) return d;
    return std::nullopt;
  }

  if (value.isString()) {
    const std::string s = value.asString();
    if (s.empty()) return std::nullopt;
    try {
      size_t consumed = 0;
      double d = std::stod(s, &consumed);
      if (consumed == s.size() && std::isfinite(d)) return d;
    } catch (const std::exception&) {
      // "-" and friends mean no reading
    }
  }
  return std::nullopt;
}

std::optional<std::string> text(const Json::Value& object, const char* key) {
  if (!object.isObject() || !object.isMember(key)) {
    return std::nullopt;
  }

  const Json::Value& value = object[key];
  if (value.isString()) {
    std::string s = value.asString();
    if (s.empty()) return std::nullopt;
    return s;
  }
  if (value.isNumeric()) {
    return idString(value);
  }
  return std::nullopt;
}

std::string idString(const Json::Value& value) {
  if (value.isIntegral()) {
    return std::to_string(value.asLargestInt());
  }
  if (value.isNumeric()) {
    double d = value.asDouble();
    if (std::floor(d) == d && std::fabs(d) < 1e15) {
      return std::to_string(static_cast<long long>(d));
    }
    std::ostringstream out;
    out << d;
    return out.str();
  }
  if (value.isString()) {
    return value.asString();
  }
  return "";
}

std::string isoFromEpochMillis(long long epoch_ms) {
  std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  int millis = static_cast<int>(epoch_ms % 1000);
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
      << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

} // namespace JsonFields
