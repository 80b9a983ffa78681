#pragma once

#include "../core/Constants.h"
#include "../network/HttpClient.h"
#include "LocationProvider.h"

// ipapi.co: free, no key, rate-limits aggressively.
class IpApiProvider : public LocationProvider {
public:
  IpApiProvider(HttpClient &http,
                long timeoutSeconds = AuroraCast::LOCATION_TIMEOUT_S);

  std::string name() const override { return "ipapi.co"; }

  IpLocation fetch() override;

private:
  static constexpr const char *URL = "https://ipapi.co/json/";

  HttpClient &http_;
  long timeoutSeconds_;
};
