#include "LocationResolver.h"

#include "../core/Logger.h"
#include "../core/StringUtils.h"

#include <fmt/format.h>

LocationResolver::LocationResolver(
    TtlLruCache &cache,
    std::vector<std::unique_ptr<LocationProvider>> providers, int locationTtl)
    : cache_(cache), providers_(std::move(providers)),
      locationTtl_(locationTtl) {}

void LocationResolver::validate(double latitude, double longitude) {
  if (!(latitude >= -90.0 && latitude <= 90.0))
    throw ValidationError("Latitude must be between -90 and 90");
  if (!(longitude >= -180.0 && longitude <= 180.0))
    throw ValidationError("Longitude must be between -180 and 180");
}

ResolvedLocation LocationResolver::resolve(std::optional<double> latitude,
                                           std::optional<double> longitude) {
  if (latitude && longitude) {
    validate(*latitude, *longitude);
    ResolvedLocation r;
    r.coordinate = {*latitude, *longitude};
    r.displayName = StringUtils::formatLatLon(*latitude, *longitude);
    r.source = LocationSource::User;
    return r;
  }

  ResolvedLocation r;
  r.source = LocationSource::Ip;
  if (latitude.has_value() != longitude.has_value()) {
    LOG_I("LocationResolver", "Only one coordinate given, using IP location");
    r.note = PARTIAL_NOTE;
  }

  IpLookupResult ip = lookupIp();
  r.coordinate = ip.location.coordinate;
  r.displayName = fmt::format("{}, {}, {}", ip.location.city,
                              ip.location.region, ip.location.country);
  r.ipLocation = ip.location;
  r.providerFailures = std::move(ip.failures);
  return r;
}

IpLookupResult LocationResolver::lookupIp() {
  IpLookupResult result;
  nlohmann::json value =
      cache_.getOrFetch(AuroraCast::KEY_USER_LOCATION, locationTtl_,
                        [&] { return nlohmann::json(queryProviders(result)); });
  result.location = value.get<IpLocation>();
  return result;
}

IpLocation LocationResolver::queryProviders(IpLookupResult &result) {
  for (const auto &provider : providers_) {
    IpLocation location;
    try {
      location = provider->fetch();
    } catch (const RecoverableProviderError &e) {
      LOG_W("LocationResolver", "{}", e.what());
      result.failures.emplace_back(e.what());
      continue;
    }

    result.provider = provider->name();
    LOG_I("LocationResolver", "Located via {}: {}, {} ({:.2f}, {:.2f})",
          result.provider, location.city, location.country,
          location.coordinate.latitude, location.coordinate.longitude);
    return location;
  }

  std::string reasons = result.failures.empty()
                            ? std::string("No providers available.")
                            : StringUtils::join(result.failures, "; ");
  LOG_E("LocationResolver", "All location providers failed");
  throw LocationUnavailableError("Could not determine location from IP. " +
                                 reasons);
}
