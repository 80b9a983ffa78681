#include "NOAAProvider.h"

#include "../core/Constants.h"
#include "../core/Logger.h"
#include "../core/SpaceWeatherData.h"

NOAAProvider::NOAAProvider(HttpClient &net, TtlLruCache &cache,
                           const AppConfig &cfg)
    : net_(net), cache_(cache), ttl_(cfg.ttl), timeout_(cfg.noaaTimeout),
      enlilTimeout_(cfg.enlilTimeout) {}

nlohmann::json NOAAProvider::fetchJson(const char *dataset, const char *url,
                                       long timeoutSeconds) {
  HttpResponse resp;
  try {
    resp = net_.get(url, timeoutSeconds);
  } catch (const std::exception &e) {
    LOG_E("NOAAProvider", "{} fetch failed: {}", dataset, e.what());
    throw NetworkError(dataset, e.what());
  }

  if (resp.status < 200 || resp.status >= 300) {
    LOG_E("NOAAProvider", "{} returned HTTP {}", dataset, resp.status);
    throw NetworkError(dataset, "HTTP status " + std::to_string(resp.status));
  }

  auto j = nlohmann::json::parse(resp.body, nullptr, false);
  if (j.is_discarded()) {
    LOG_E("NOAAProvider", "{} returned invalid JSON", dataset);
    throw NetworkError(dataset, "invalid JSON");
  }

  LOG_I("NOAAProvider", "Fetched {} ({} bytes)", dataset, resp.body.size());
  return j;
}

nlohmann::json NOAAProvider::fetchAuroraGrid() {
  return cache_.getOrFetch(AuroraCast::KEY_OVATION, ttl_.ovation, [this]() {
    return fetchJson("OVATION", OVATION_URL, timeout_);
  });
}

nlohmann::json NOAAProvider::fetchKpIndex() {
  return cache_.getOrFetch(AuroraCast::KEY_KP_INDEX, ttl_.kpIndex, [this]() {
    return fetchJson("Kp index", K_INDEX_URL, timeout_);
  });
}

nlohmann::json NOAAProvider::fetchSolarWind() {
  return cache_.getOrFetch(AuroraCast::KEY_ENLIL, ttl_.enlil, [this]() {
    return fetchJson("ENLIL", ENLIL_URL, enlilTimeout_);
  });
}

nlohmann::json NOAAProvider::fetchFlareProbabilities() {
  return cache_.getOrFetch(
      AuroraCast::KEY_SOLAR_PROBABILITIES, ttl_.solarProbabilities, [this]() {
        return fetchJson("solar probabilities", SOLAR_PROB_URL, timeout_);
      });
}
