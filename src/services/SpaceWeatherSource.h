#pragma once

#include <nlohmann/json.hpp>

// NOAA SWPC datasets consumed by the aggregator and the reports. Each call
// either returns the parsed payload or throws NetworkError.
class SpaceWeatherSource {
public:
  virtual ~SpaceWeatherSource() = default;

  // {"coordinates": [[lon, lat, probability], ...], ...}
  virtual nlohmann::json fetchAuroraGrid() = 0;

  // [{"time_tag": ..., "kp": ...}, ...], oldest first as NOAA serves it
  virtual nlohmann::json fetchKpIndex() = 0;

  // ENLIL solar-wind model time series, passed through unparsed
  virtual nlohmann::json fetchSolarWind() = 0;

  // Flare probability record, passed through unparsed
  virtual nlohmann::json fetchFlareProbabilities() = 0;
};
