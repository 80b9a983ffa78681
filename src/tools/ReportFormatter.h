#pragma once

#include "../core/TtlLruCache.h"
#include "../services/AuroraAggregator.h"
#include "../services/LocationResolver.h"
#include "../services/SpaceWeatherSource.h"

#include <optional>
#include <string>

// Human-readable text for each tool. Errors from the resolver and the NOAA
// fetchers propagate to the caller.
class ReportFormatter {
public:
  ReportFormatter(LocationResolver &resolver, AuroraAggregator &aggregator,
                  SpaceWeatherSource &source, TtlLruCache &cache);

  std::string auroraForecast(std::optional<double> lat = std::nullopt,
                             std::optional<double> lon = std::nullopt);
  std::string auroraPrediction(std::optional<double> lat,
                               std::optional<double> lon, int hoursAhead = 24);
  std::string currentKpIndex();
  std::string verifyLocation();
  std::string cacheStats() const;
  std::string clearCache();

  static std::string viewingRecommendation(double probability);

  // NOAA G-scale (0-5) for a Kp value
  static int geomagneticScale(double kp);

  // Kp as NOAA reported it: strings verbatim, numbers as JSON text
  static std::string kpText(const nlohmann::json &kp);

private:
  LocationResolver &resolver_;
  AuroraAggregator &aggregator_;
  SpaceWeatherSource &source_;
  TtlLruCache &cache_;
};
