#include "NetworkManager.h"

#include "../core/Logger.h"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

static size_t writeCallback(char *ptr, size_t size, size_t nmemb,
                            void *userdata) {
  auto *response = static_cast<std::string *>(userdata);
  response->append(ptr, size * nmemb);
  return size * nmemb;
}

NetworkManager::NetworkManager(std::string userAgent)
    : userAgent_(std::move(userAgent)) {}

HttpResponse NetworkManager::get(const std::string &url,
                                 long timeoutSeconds) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(),
                                                           &curl_easy_cleanup);
  if (!curl)
    throw std::runtime_error("curl_easy_init failed");

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());

  LOG_D("NetworkManager", "GET {} (timeout {}s)", url, timeoutSeconds);
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    LOG_W("NetworkManager", "fetch failed for {}: {}", url,
          curl_easy_strerror(res));
    throw std::runtime_error(curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  LOG_D("NetworkManager", "{} -> HTTP {} ({} bytes)", url, response.status,
        response.body.size());
  return response;
}
