#include "IpWhoIsProvider.h"

#include <fmt/format.h>

IpWhoIsProvider::IpWhoIsProvider(HttpClient &http, long timeoutSeconds)
    : http_(http), timeoutSeconds_(timeoutSeconds) {}

IpLocation IpWhoIsProvider::fetch() {
  HttpResponse resp;
  nlohmann::json data;
  try {
    resp = http_.get(URL, timeoutSeconds_);
    data = nlohmann::json::parse(resp.body);
  } catch (const std::exception &e) {
    throw RecoverableProviderError(fmt::format("{}: {}", name(), e.what()));
  }

  if (data.is_object() && data.contains("success") &&
      data["success"].is_boolean() && !data["success"].get<bool>()) {
    throw RecoverableProviderError(
        fmt::format("{}: {}", name(), fieldOr(data, "message", "error")));
  }

  if (hasCoordinates(data)) {
    IpLocation loc;
    loc.coordinate.latitude = data["latitude"].get<double>();
    loc.coordinate.longitude = data["longitude"].get<double>();
    loc.city = fieldOr(data, "city", "Unknown");
    loc.region = fieldOr(data, "region", "Unknown");
    loc.country = fieldOr(data, "country", "Unknown");
    return loc;
  }

  throw RecoverableProviderError(
      fmt::format("{}: unexpected response (status={})", name(), resp.status));
}
