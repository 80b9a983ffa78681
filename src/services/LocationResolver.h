#pragma once

#include "../core/Constants.h"
#include "../core/SpaceWeatherData.h"
#include "../core/TtlLruCache.h"
#include "LocationProvider.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

struct IpLookupResult {
  IpLocation location;
  std::string provider; // empty when served from cache
  std::vector<std::string> failures;
};

// Turns optional user coordinates into one authoritative location, falling
// back to the IP provider chain when the user did not supply both values.
class LocationResolver {
public:
  static constexpr const char *PARTIAL_NOTE =
      "partial coordinates supplied; falling back to IP location";

  LocationResolver(TtlLruCache &cache,
                   std::vector<std::unique_ptr<LocationProvider>> providers,
                   int locationTtl = AuroraCast::TTL_LOCATION);

  // Throws ValidationError when both coordinates are given and one is out of
  // bounds, LocationUnavailableError when the IP chain is exhausted.
  ResolvedLocation resolve(std::optional<double> latitude,
                           std::optional<double> longitude);

  // Providers are tried in order; the first success is cached and returned.
  IpLookupResult lookupIp();

  static void validate(double latitude, double longitude);

private:
  // Walks the chain, recording each failure in result.failures.
  IpLocation queryProviders(IpLookupResult &result);

  TtlLruCache &cache_;
  std::vector<std::unique_ptr<LocationProvider>> providers_;
  int locationTtl_;
};
