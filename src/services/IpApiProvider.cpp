#include "IpApiProvider.h"

#include <fmt/format.h>

IpApiProvider::IpApiProvider(HttpClient &http, long timeoutSeconds)
    : http_(http), timeoutSeconds_(timeoutSeconds) {}

IpLocation IpApiProvider::fetch() {
  HttpResponse resp;
  nlohmann::json data;
  try {
    resp = http_.get(URL, timeoutSeconds_);
    data = nlohmann::json::parse(resp.body);
  } catch (const std::exception &e) {
    throw RecoverableProviderError(fmt::format("{}: {}", name(), e.what()));
  }

  if (resp.status == 200 && hasCoordinates(data)) {
    IpLocation loc;
    loc.coordinate.latitude = data["latitude"].get<double>();
    loc.coordinate.longitude = data["longitude"].get<double>();
    loc.city = fieldOr(data, "city", "Unknown");
    loc.region = fieldOr(data, "region", "Unknown");
    loc.country =
        fieldOr(data, "country_name", fieldOr(data, "country", "Unknown"));
    return loc;
  }

  // Rate limiting comes back as {"error": true, "reason": ..., "message": ...}
  if (data.is_object() && data.contains("error") &&
      data["error"].is_boolean() && data["error"].get<bool>()) {
    throw RecoverableProviderError(
        fmt::format("{}: {} ({})", name(), fieldOr(data, "reason", "error"),
                    fieldOr(data, "message", "no message")));
  }

  throw RecoverableProviderError(
      fmt::format("{}: unexpected response (status={})", name(), resp.status));
}
