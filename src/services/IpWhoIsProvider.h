#pragma once

#include "../core/Constants.h"
#include "../network/HttpClient.h"
#include "LocationProvider.h"

// ipwho.is: free, no key, supports selective fields.
class IpWhoIsProvider : public LocationProvider {
public:
  IpWhoIsProvider(HttpClient &http,
                  long timeoutSeconds = AuroraCast::LOCATION_TIMEOUT_S);

  std::string name() const override { return "ipwho.is"; }

  IpLocation fetch() override;

private:
  static constexpr const char *URL =
      "https://ipwho.is/"
      "?fields=success,message,latitude,longitude,city,region,country";

  HttpClient &http_;
  long timeoutSeconds_;
};
