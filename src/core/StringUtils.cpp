#include "StringUtils.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

namespace StringUtils {

std::string formatLatLon(double lat, double lon) {
  return fmt::format("{:.2f}°, {:.2f}°", lat, lon);
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      out += sep;
    out += parts[i];
  }
  return out;
}

double safe_stod(const std::string &s) {
  if (s.empty()) {
    return 0.0;
  }
  // strtod is exception-free and stable where from_chars(double) is missing.
  char *endptr = nullptr;
  double val = std::strtod(s.c_str(), &endptr);
  return val;
}

std::optional<double> parseDouble(const std::string &s) {
  const char *begin = s.c_str();
  char *endptr = nullptr;
  errno = 0;
  double val = std::strtod(begin, &endptr);
  if (endptr == begin || errno == ERANGE || !std::isfinite(val))
    return std::nullopt;
  while (*endptr != '\0' && std::isspace(static_cast<unsigned char>(*endptr)))
    ++endptr;
  if (*endptr != '\0')
    return std::nullopt;
  return val;
}

} // namespace StringUtils
