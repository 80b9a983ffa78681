#pragma once

#include "../core/Constants.h"
#include "../core/SpaceWeatherData.h"
#include "../core/TtlLruCache.h"
#include "SpaceWeatherSource.h"

#include <string>

// Combines the OVATION grid and the Kp series into a per-location snapshot,
// cached per 0.5 degree cell.
class AuroraAggregator {
public:
  AuroraAggregator(TtlLruCache &cache, SpaceWeatherSource &source,
                   int snapshotTtl = AuroraCast::TTL_OVATION);

  // On a cache hit the stored snapshot is returned as is, so its coordinate is
  // the one of the request that populated the cell.
  AuroraSnapshot snapshot(const Coordinate &coord);

  // "aurora_60.0_-150.5"
  static std::string cellKey(const Coordinate &coord);

  // Last element of the series, or "Unknown" when there is none.
  static nlohmann::json latestKp(const nlohmann::json &kpSeries);

private:
  TtlLruCache &cache_;
  SpaceWeatherSource &source_;
  int snapshotTtl_;
};
