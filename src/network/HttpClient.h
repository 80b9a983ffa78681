#pragma once

#include <string>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Blocking HTTP GET. Transport faults (timeout, DNS, TLS) throw
// std::runtime_error; any HTTP status is returned to the caller.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  virtual HttpResponse get(const std::string &url, long timeoutSeconds) = 0;
};
