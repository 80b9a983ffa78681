#pragma once

#include "Constants.h"

#include <filesystem>
#include <string>

struct CacheTtlConfig {
  int location = AuroraCast::TTL_LOCATION;
  int ovation = AuroraCast::TTL_OVATION;
  int kpIndex = AuroraCast::TTL_KP_INDEX;
  int enlil = AuroraCast::TTL_ENLIL;
  int solarProbabilities = AuroraCast::TTL_SOLAR_PROBABILITIES;
};

struct AppConfig {
  // Cache
  int cacheCapacity = AuroraCast::DEFAULT_CACHE_CAPACITY;
  CacheTtlConfig ttl;

  // Network (seconds)
  long locationTimeout = AuroraCast::LOCATION_TIMEOUT_S;
  long noaaTimeout = AuroraCast::NOAA_TIMEOUT_S;
  long enlilTimeout = AuroraCast::ENLIL_TIMEOUT_S;
  std::string userAgent = "AuroraCast/1.0";

  // Logging
  std::string logLevel = "warn";
  std::string logDir; // empty = stderr only
};

class ConfigManager {
public:
  // Resolves the config directory and file path. An explicit path wins over
  // $XDG_CONFIG_HOME/auroracast and $HOME/.config/auroracast.
  // Returns false if the path could not be determined.
  bool init(const std::filesystem::path &explicitPath = {});

  // Load config from disk. Returns false if file is missing or invalid; config
  // keeps its defaults for anything not read. When the file exists but cannot
  // be used, *error receives the reason.
  bool load(AppConfig &config, std::string *error = nullptr) const;

  // Save config to disk. Creates directories if needed. Returns false on
  // failure.
  bool save(const AppConfig &config) const;

  const std::filesystem::path &configPath() const { return configPath_; }
  const std::filesystem::path &configDir() const { return configDir_; }

private:
  std::filesystem::path configDir_;
  std::filesystem::path configPath_;
};
