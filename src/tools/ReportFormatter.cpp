#include "ReportFormatter.h"

#include "../core/StringUtils.h"

#include <fmt/format.h>

ReportFormatter::ReportFormatter(LocationResolver &resolver,
                                 AuroraAggregator &aggregator,
                                 SpaceWeatherSource &source,
                                 TtlLruCache &cache)
    : resolver_(resolver), aggregator_(aggregator), source_(source),
      cache_(cache) {}

std::string ReportFormatter::viewingRecommendation(double probability) {
  if (probability > 50)
    return "HIGH - Excellent aurora viewing conditions!";
  if (probability > 25)
    return "MODERATE - Aurora may be visible with clear skies";
  return "LOW - Aurora unlikely to be visible";
}

// G1: Kp=5, G2: Kp=6, G3: Kp=7, G4: Kp=8, G5: Kp=9
int ReportFormatter::geomagneticScale(double kp) {
  if (kp >= 9)
    return 5; // G5 (Extreme)
  if (kp >= 8)
    return 4; // G4 (Severe)
  if (kp >= 7)
    return 3; // G3 (Strong)
  if (kp >= 6)
    return 2; // G2 (Moderate)
  if (kp >= 5)
    return 1; // G1 (Minor)
  return 0;
}

std::string ReportFormatter::kpText(const nlohmann::json &kp) {
  return kp.is_string() ? kp.get<std::string>() : kp.dump();
}

std::string ReportFormatter::auroraForecast(std::optional<double> lat,
                                            std::optional<double> lon) {
  ResolvedLocation loc = resolver_.resolve(lat, lon);
  AuroraSnapshot snap = aggregator_.snapshot(loc.coordinate);

  std::string out = fmt::format(
      "Aurora Forecast for {}\n"
      "Location: {}\n"
      "\n"
      "Current Aurora Probability: {:.1f}%\n"
      "Current Kp Index: {}\n"
      "\n"
      "Viewing Recommendation:\n",
      loc.displayName,
      StringUtils::formatLatLon(loc.coordinate.latitude,
                                loc.coordinate.longitude),
      snap.probability, kpText(snap.kpIndex));
  out += viewingRecommendation(snap.probability);

  if (loc.coordinate.latitude > 0 && loc.coordinate.latitude < 55) {
    out += "\n\nNote: Your latitude is quite far south. Aurora is typically "
           "visible above 60°N.";
  }
  if (loc.note)
    out += "\n\nNote: " + *loc.note;
  return out;
}

std::string ReportFormatter::auroraPrediction(std::optional<double> lat,
                                              std::optional<double> lon,
                                              int hoursAhead) {
  ResolvedLocation loc = resolver_.resolve(lat, lon);
  nlohmann::json enlil = source_.fetchSolarWind();
  // Loaded so a failing feed surfaces here; not analysed yet.
  nlohmann::json flares = source_.fetchFlareProbabilities();

  std::string out = fmt::format(
      "Aurora Prediction for {}\n"
      "Location: {}\n"
      "\n"
      "Forecast Period: Next {} hours\n"
      "\n"
      "Based on ENLIL solar wind model and solar activity forecasts:\n"
      "- Solar wind data points available: {}\n"
      "- Solar flare probabilities loaded ({} records)\n"
      "\n"
      "Note: Full prediction analysis requires parsing ENLIL time series "
      "data.\n"
      "This would predict CME arrivals and geomagnetic storm timing.\n",
      loc.displayName,
      StringUtils::formatLatLon(loc.coordinate.latitude,
                                loc.coordinate.longitude),
      hoursAhead, enlil.size(), flares.size());

  if (loc.note)
    out += "\nNote: " + *loc.note + "\n";
  return out;
}

std::string ReportFormatter::currentKpIndex() {
  nlohmann::json series = source_.fetchKpIndex();
  if (!series.is_array() || series.empty())
    return "Current Geomagnetic Activity (Kp Index)\n\n"
           "No Kp index data available from NOAA.\n";

  const nlohmann::json &latest = series.back();
  nlohmann::json kp = AuroraAggregator::latestKp(series);
  std::string timeTag = "Unknown";
  if (latest.is_object() && latest.contains("time_tag") &&
      latest["time_tag"].is_string())
    timeTag = latest["time_tag"].get<std::string>();

  double kpValue = 0.0;
  if (kp.is_number())
    kpValue = kp.get<double>();
  else if (kp.is_string())
    kpValue = StringUtils::safe_stod(kp.get<std::string>());

  return fmt::format("Current Geomagnetic Activity (Kp Index)\n"
                     "\n"
                     "Kp: {}\n"
                     "Time: {}\n"
                     "NOAA Storm Level: G{}\n"
                     "\n"
                     "Scale:\n"
                     "0-2: Quiet\n"
                     "3-4: Unsettled\n"
                     "5: Minor storm (G1)\n"
                     "6: Moderate storm (G2)\n"
                     "7: Strong storm (G3)\n"
                     "8: Severe storm (G4)\n"
                     "9: Extreme storm (G5)\n"
                     "\n"
                     "Higher Kp values mean better aurora visibility at lower "
                     "latitudes.\n",
                     kpText(kp), timeTag, geomagneticScale(kpValue));
}

std::string ReportFormatter::verifyLocation() {
  IpLocation loc = resolver_.lookupIp().location;
  return fmt::format(
      "Detected Location from IP Address:\n"
      "\n"
      "City: {}\n"
      "Region: {}\n"
      "Country: {}\n"
      "Coordinates: {}\n"
      "\n"
      "Note: IP geolocation is approximate (city-level accuracy).\n"
      "If this is incorrect, use get_aurora_forecast with exact "
      "coordinates.\n",
      loc.city, loc.region, loc.country,
      StringUtils::formatLatLon(loc.coordinate.latitude,
                                loc.coordinate.longitude));
}

std::string ReportFormatter::cacheStats() const {
  CacheStats s = cache_.stats();
  std::string out = fmt::format("Cache Statistics:\n"
                                "\n"
                                "Size: {}/{} entries\n"
                                "Hit Rate: {}\n"
                                "Hits: {}\n"
                                "Misses: {}\n"
                                "\n"
                                "Cached Keys:\n",
                                s.size, s.capacity, s.hitRateText, s.hits,
                                s.misses);
  for (const auto &key : s.keys)
    out += "  - " + key + "\n";
  return out;
}

std::string ReportFormatter::clearCache() {
  cache_.clear();
  return "Cache cleared. Next requests will fetch fresh data from NOAA.";
}
