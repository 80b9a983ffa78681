#pragma once

// Project-wide constants for AuroraCast

namespace AuroraCast {

static constexpr const char *VERSION = "1.0.0";

// Default LRU capacity of the shared cache
static constexpr int DEFAULT_CACHE_CAPACITY = 50;

// Cache TTLs in seconds
static constexpr int TTL_LOCATION = 3600;
static constexpr int TTL_OVATION = 300;
static constexpr int TTL_KP_INDEX = 180;
static constexpr int TTL_ENLIL = 3600;
static constexpr int TTL_SOLAR_PROBABILITIES = 3600;

// Per-call network timeouts in seconds
static constexpr long LOCATION_TIMEOUT_S = 5;
static constexpr long NOAA_TIMEOUT_S = 10;
static constexpr long ENLIL_TIMEOUT_S = 15;

// Fixed cache keys
static constexpr const char *KEY_USER_LOCATION = "user_location";
static constexpr const char *KEY_OVATION = "ovation_data";
static constexpr const char *KEY_KP_INDEX = "kp_index";
static constexpr const char *KEY_ENLIL = "enlil_data";
static constexpr const char *KEY_SOLAR_PROBABILITIES = "solar_probabilities";

// Prefix of the per-cell aurora snapshot keys
static constexpr const char *KEY_AURORA_PREFIX = "aurora_";

} // namespace AuroraCast
