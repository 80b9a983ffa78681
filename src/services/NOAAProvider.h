#pragma once

#include "../core/ConfigManager.h"
#include "../core/TtlLruCache.h"
#include "../network/HttpClient.h"
#include "SpaceWeatherSource.h"

#include <string>

// Fetches NOAA SWPC JSON products, each memoized in the shared cache under its
// own key and TTL.
class NOAAProvider : public SpaceWeatherSource {
public:
  NOAAProvider(HttpClient &net, TtlLruCache &cache,
               const AppConfig &cfg = AppConfig{});

  nlohmann::json fetchAuroraGrid() override;
  nlohmann::json fetchKpIndex() override;
  nlohmann::json fetchSolarWind() override;
  nlohmann::json fetchFlareProbabilities() override;

  static constexpr const char *OVATION_URL =
      "https://services.swpc.noaa.gov/json/ovation_aurora_latest.json";
  static constexpr const char *K_INDEX_URL =
      "https://services.swpc.noaa.gov/json/planetary_k_index_1m.json";
  static constexpr const char *ENLIL_URL =
      "https://services.swpc.noaa.gov/json/enlil_time_series.json";
  static constexpr const char *SOLAR_PROB_URL =
      "https://services.swpc.noaa.gov/json/solar_probabilities.json";

private:
  nlohmann::json fetchJson(const char *dataset, const char *url,
                           long timeoutSeconds);

  HttpClient &net_;
  TtlLruCache &cache_;
  CacheTtlConfig ttl_;
  long timeout_;
  long enlilTimeout_;
};
