#pragma once

#include "../core/SpaceWeatherData.h"

#include <nlohmann/json.hpp>
#include <string>

// One IP geolocation source in the resolver's provider chain.
class LocationProvider {
public:
  virtual ~LocationProvider() = default;

  // Short name used as the prefix of failure messages, e.g. "ipapi.co".
  virtual std::string name() const = 0;

  // Throws RecoverableProviderError on any failure, transport faults included.
  virtual IpLocation fetch() = 0;

protected:
  static bool hasCoordinates(const nlohmann::json &data) {
    return data.is_object() && data.contains("latitude") &&
           data["latitude"].is_number() && data.contains("longitude") &&
           data["longitude"].is_number();
  }

  // String field, or fallback when absent or null. Non-string values are
  // rendered as JSON text.
  static std::string fieldOr(const nlohmann::json &data, const char *key,
                             const std::string &fallback) {
    if (!data.is_object() || !data.contains(key) || data[key].is_null())
      return fallback;
    const auto &v = data[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
  }
};
