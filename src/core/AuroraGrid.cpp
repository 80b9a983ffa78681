#include "AuroraGrid.h"

#include <cmath>
#include <limits>

namespace AuroraGrid {

std::vector<GridPoint> parse(const nlohmann::json &ovation) {
  std::vector<GridPoint> grid;
  if (!ovation.is_object() || !ovation.contains("coordinates"))
    return grid;

  const auto &coords = ovation["coordinates"];
  if (!coords.is_array())
    return grid;

  grid.reserve(coords.size());
  for (const auto &p : coords) {
    if (!p.is_array() || p.size() < 3 || !p[0].is_number() ||
        !p[1].is_number() || !p[2].is_number())
      continue;
    grid.push_back(
        {p[0].get<double>(), p[1].get<double>(), p[2].get<double>()});
  }
  return grid;
}

double nearest(const Coordinate &coord, const std::vector<GridPoint> &grid) {
  double minDistance = std::numeric_limits<double>::infinity();
  double probability = 0.0;

  for (const auto &p : grid) {
    double dLat = coord.latitude - p.latitude;
    double dLon = coord.longitude - p.longitude;
    double distance = std::sqrt(dLat * dLat + dLon * dLon);
    if (distance < minDistance) {
      minDistance = distance;
      probability = p.probability;
    }
  }
  return probability;
}

double nearest(const Coordinate &coord, const nlohmann::json &ovation) {
  return nearest(coord, parse(ovation));
}

} // namespace AuroraGrid
