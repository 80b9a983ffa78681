#include "ToolServer.h"

#include "../core/Logger.h"
#include "../core/SpaceWeatherData.h"
#include "../core/StringUtils.h"

#include <cmath>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>

const std::vector<ToolInfo> &ToolServer::tools() {
  static const std::vector<ToolInfo> list = {
      {"get_aurora_forecast",
       "Aurora forecast for the given latitude/longitude, or the IP-based "
       "location when either is missing"},
      {"get_aurora_forecast_auto",
       "Aurora forecast for your current location (detected from IP)"},
      {"get_current_kp_index",
       "Current planetary K-index (geomagnetic activity level)"},
      {"get_aurora_prediction",
       "Aurora outlook from the ENLIL solar wind model; accepts latitude, "
       "longitude and hours_ahead (default 24)"},
      {"verify_my_location", "Location detected from your IP address"},
      {"get_cache_stats", "Cache size, hit rate and cached keys"},
      {"clear_cache", "Clear all cached data to force a fresh fetch"},
  };
  return list;
}

static std::optional<double> numberArg(const nlohmann::json &args,
                                       const char *key) {
  if (!args.is_object() || !args.contains(key) || args[key].is_null())
    return std::nullopt;
  const auto &v = args[key];
  if (v.is_number())
    return v.get<double>();
  if (v.is_string()) {
    if (auto parsed = StringUtils::parseDouble(v.get<std::string>()))
      return parsed;
  }
  throw ValidationError(std::string(key) + " must be a number");
}

static int hoursArg(const nlohmann::json &args) {
  auto h = numberArg(args, "hours_ahead");
  if (!h)
    return 24;
  if (!std::isfinite(*h) || *h < 0 ||
      *h > static_cast<double>(std::numeric_limits<int>::max()))
    throw ValidationError("hours_ahead must be a non-negative whole number of "
                          "hours");
  return static_cast<int>(*h);
}

ToolServer::ToolServer(ReportFormatter &reports) : reports_(reports) {}

std::string ToolServer::call(const std::string &tool,
                             const nlohmann::json &args) {
  if (tool == "get_aurora_forecast") {
    auto lat = numberArg(args, "latitude");
    auto lon = numberArg(args, "longitude");
    return reports_.auroraForecast(lat, lon);
  }
  if (tool == "get_aurora_forecast_auto")
    return reports_.auroraForecast();
  if (tool == "get_current_kp_index")
    return reports_.currentKpIndex();
  if (tool == "get_aurora_prediction") {
    int hours = hoursArg(args);
    auto lat = numberArg(args, "latitude");
    auto lon = numberArg(args, "longitude");
    return reports_.auroraPrediction(lat, lon, hours);
  }
  if (tool == "verify_my_location")
    return reports_.verifyLocation();
  if (tool == "get_cache_stats")
    return reports_.cacheStats();
  if (tool == "clear_cache")
    return reports_.clearCache();

  throw std::invalid_argument("Unknown tool: " + tool);
}

nlohmann::json ToolServer::handle(const nlohmann::json &request) {
  nlohmann::json response;
  response["id"] = request.is_object() && request.contains("id")
                       ? request["id"]
                       : nlohmann::json();

  if (!request.is_object() || !request.contains("tool") ||
      !request["tool"].is_string()) {
    response["ok"] = false;
    response["error"] = "request must be an object with a \"tool\" string";
    return response;
  }

  const std::string tool = request["tool"].get<std::string>();
  if (tool == "list_tools") {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &t : tools())
      list.push_back({{"name", t.name}, {"description", t.description}});
    response["ok"] = true;
    response["tools"] = std::move(list);
    return response;
  }

  nlohmann::json args = request.value("arguments", nlohmann::json::object());
  try {
    response["text"] = call(tool, args);
    response["ok"] = true;
    LOG_D("ToolServer", "{} ok", tool);
  } catch (const ValidationError &e) {
    LOG_W("ToolServer", "{}: {}", tool, e.what());
    response["ok"] = false;
    response["error"] = e.what();
  } catch (const std::exception &e) {
    LOG_E("ToolServer", "{} failed: {}", tool, e.what());
    response["ok"] = false;
    response["error"] = e.what();
  }
  return response;
}

std::string ToolServer::handleLine(const std::string &line) {
  auto request = nlohmann::json::parse(line, nullptr, false);
  if (request.is_discarded()) {
    LOG_W("ToolServer", "Discarding malformed request line");
    nlohmann::json response = {{"id", nullptr},
                               {"ok", false},
                               {"error", "malformed JSON request"}};
    return response.dump();
  }
  return handle(request).dump(-1, ' ', false,
                              nlohmann::json::error_handler_t::replace);
}

void ToolServer::run(std::istream &in, std::ostream &out) {
  LOG_I("ToolServer", "Serving {} tools on stdio", tools().size());
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos)
      continue;
    out << handleLine(line) << std::endl;
  }
  LOG_I("ToolServer", "Input closed, stopping");
}
