#include "ConfigManager.h"

#include "Logger.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

bool ConfigManager::init(const std::filesystem::path &explicitPath) {
  if (!explicitPath.empty()) {
    configPath_ = explicitPath;
    configDir_ = explicitPath.parent_path();
    return true;
  }

  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    configDir_ = std::filesystem::path(xdg) / "auroracast";
  } else if (const char *home = std::getenv("HOME"); home && *home) {
    configDir_ = std::filesystem::path(home) / ".config" / "auroracast";
  } else {
    LOG_W("ConfigManager", "Neither XDG_CONFIG_HOME nor HOME is set");
    return false;
  }

  configPath_ = configDir_ / "config.json";
  return true;
}

bool ConfigManager::load(AppConfig &config, std::string *error) const {
  if (configPath_.empty())
    return false;

  std::ifstream ifs(configPath_);
  if (!ifs) {
    std::error_code ec;
    if (std::filesystem::exists(configPath_, ec) && error)
      *error = "cannot open file";
    return false;
  }

  auto json = nlohmann::json::parse(ifs, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    LOG_E("ConfigManager", "invalid JSON in {}", configPath_.string());
    if (error)
      *error = "invalid JSON";
    return false;
  }

  try {
    if (json.contains("cache")) {
      auto &c = json["cache"];
      config.cacheCapacity = c.value("capacity", config.cacheCapacity);
      if (c.contains("ttl")) {
        auto &t = c["ttl"];
        config.ttl.location = t.value("location", config.ttl.location);
        config.ttl.ovation = t.value("ovation", config.ttl.ovation);
        config.ttl.kpIndex = t.value("kp_index", config.ttl.kpIndex);
        config.ttl.enlil = t.value("enlil", config.ttl.enlil);
        config.ttl.solarProbabilities =
            t.value("solar_probabilities", config.ttl.solarProbabilities);
      }
    }

    if (json.contains("network")) {
      auto &n = json["network"];
      config.locationTimeout =
          n.value("location_timeout", config.locationTimeout);
      config.noaaTimeout = n.value("noaa_timeout", config.noaaTimeout);
      config.enlilTimeout = n.value("enlil_timeout", config.enlilTimeout);
      config.userAgent = n.value("user_agent", config.userAgent);
    }

    if (json.contains("logging")) {
      auto &l = json["logging"];
      config.logLevel = l.value("level", config.logLevel);
      config.logDir = l.value("dir", config.logDir);
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_E("ConfigManager", "bad value in {}: {}", configPath_.string(),
          e.what());
    if (error)
      *error = std::string("bad value: ") + e.what();
    return false;
  }

  if (config.cacheCapacity <= 0) {
    LOG_W("ConfigManager", "cache.capacity must be positive, using {}",
          AuroraCast::DEFAULT_CACHE_CAPACITY);
    config.cacheCapacity = AuroraCast::DEFAULT_CACHE_CAPACITY;
  }

  LOG_I("ConfigManager", "Loaded {}", configPath_.string());
  return true;
}

bool ConfigManager::save(const AppConfig &config) const {
  if (configPath_.empty())
    return false;

  std::error_code ec;
  if (!configDir_.empty()) {
    std::filesystem::create_directories(configDir_, ec);
    if (ec) {
      LOG_E("ConfigManager", "failed to create dir {}: {}",
            configDir_.string(), ec.message());
      return false;
    }
  }

  nlohmann::json json;
  json["cache"] = {{"capacity", config.cacheCapacity},
                   {"ttl",
                    {{"location", config.ttl.location},
                     {"ovation", config.ttl.ovation},
                     {"kp_index", config.ttl.kpIndex},
                     {"enlil", config.ttl.enlil},
                     {"solar_probabilities", config.ttl.solarProbabilities}}}};
  json["network"] = {{"location_timeout", config.locationTimeout},
                     {"noaa_timeout", config.noaaTimeout},
                     {"enlil_timeout", config.enlilTimeout},
                     {"user_agent", config.userAgent}};
  json["logging"] = {{"level", config.logLevel}, {"dir", config.logDir}};

  std::ofstream ofs(configPath_);
  if (!ofs) {
    LOG_E("ConfigManager", "cannot write {}", configPath_.string());
    return false;
  }
  ofs << json.dump(2) << "\n";
  return static_cast<bool>(ofs);
}
