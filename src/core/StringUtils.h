#pragma once

#include <optional>
#include <string>
#include <vector>

namespace StringUtils {

// "64.84°, -147.72°"
std::string formatLatLon(double lat, double lon);

// Join parts with a separator. Empty input gives an empty string.
std::string join(const std::vector<std::string> &parts, const std::string &sep);

// Safely convert a string to a double, returning 0.0 on failure.
double safe_stod(const std::string &s);

// Strict conversion: the whole string (surrounding blanks allowed) must be a
// finite number, otherwise nullopt.
std::optional<double> parseDouble(const std::string &s);

} // namespace StringUtils
