#pragma once

#include "HttpClient.h"

#include <string>

// libcurl-backed HttpClient. curl_global_init() must have been called.
class NetworkManager : public HttpClient {
public:
  explicit NetworkManager(std::string userAgent);

  HttpResponse get(const std::string &url, long timeoutSeconds) override;

private:
  std::string userAgent_;
};
