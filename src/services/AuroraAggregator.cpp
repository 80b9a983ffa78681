#include "AuroraAggregator.h"

#include "../core/AuroraGrid.h"
#include "../core/Logger.h"

#include <cmath>
#include <fmt/format.h>

// Nearest half degree; ties go to the even multiple.
static double roundHalfDegree(double x) { return std::nearbyint(x * 2.0) / 2.0; }

AuroraAggregator::AuroraAggregator(TtlLruCache &cache,
                                   SpaceWeatherSource &source, int snapshotTtl)
    : cache_(cache), source_(source), snapshotTtl_(snapshotTtl) {}

std::string AuroraAggregator::cellKey(const Coordinate &coord) {
  return fmt::format("{}{:.1f}_{:.1f}", AuroraCast::KEY_AURORA_PREFIX,
                     roundHalfDegree(coord.latitude),
                     roundHalfDegree(coord.longitude));
}

nlohmann::json AuroraAggregator::latestKp(const nlohmann::json &kpSeries) {
  if (!kpSeries.is_array() || kpSeries.empty())
    return "Unknown";
  const auto &last = kpSeries.back();
  if (!last.is_object() || !last.contains("kp") || last["kp"].is_null())
    return "Unknown";
  return last["kp"];
}

AuroraSnapshot AuroraAggregator::snapshot(const Coordinate &coord) {
  const std::string key = cellKey(coord);
  nlohmann::json value = cache_.getOrFetch(key, snapshotTtl_, [&] {
    nlohmann::json ovation = source_.fetchAuroraGrid();
    nlohmann::json kp = source_.fetchKpIndex();

    AuroraSnapshot snap;
    snap.probability = AuroraGrid::nearest(coord, ovation);
    snap.kpIndex = latestKp(kp);
    snap.coordinate = coord;

    LOG_I("AuroraAggregator", "{}: probability {:.1f}%, Kp {}", key,
          snap.probability, snap.kpIndex.dump());
    return nlohmann::json(snap);
  });
  return value.get<AuroraSnapshot>();
}
