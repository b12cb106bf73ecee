#ifndef JSON_FIELDS_HPP
#define JSON_FIELDS_HPP

#include <json/json.h>
#include <optional>
#include <string>

/**
 * Lenient accessors for upstream JSON payloads. Feeds mix numbers, numeric
 * strings and nulls for the same attribute, so every accessor tolerates all
 * three and reports absence with std::nullopt.
 */
namespace JsonFields {

// Throws std::runtime_error when the payload is not valid JSON
Json::Value parse(const std::string& body);

std::optional<double> number(const Json::Value& object, const char* key);
std::optional<std::string> text(const Json::Value& object, const char* key);

// Integral ids render without a decimal point
std::string idString(const Json::Value& value);

// Epoch milliseconds to ISO-8601 UTC, e.g. 2024-05-01T08:00:00.000Z
std::string isoFromEpochMillis(long long epoch_ms);

} // namespace JsonFields

#endif // JSON_FIELDS_HPP
