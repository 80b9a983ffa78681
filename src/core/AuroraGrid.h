#pragma once

#include "SpaceWeatherData.h"

#include <nlohmann/json.hpp>
#include <vector>

namespace AuroraGrid {

// Reads the OVATION "coordinates" array of [lon, lat, probability] triples.
// Missing or malformed data gives an empty grid; bad entries are skipped.
std::vector<GridPoint> parse(const nlohmann::json &ovation);

// Probability of the grid point closest to coord, by Euclidean distance in
// (lon, lat) degrees. A linear scan; the first point wins a tie. An empty grid
// yields 0.
double nearest(const Coordinate &coord, const std::vector<GridPoint> &grid);

double nearest(const Coordinate &coord, const nlohmann::json &ovation);

} // namespace AuroraGrid
