#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct Coordinate {
  double latitude = 0.0;
  double longitude = 0.0;
};

struct IpLocation {
  Coordinate coordinate;
  std::string city = "Unknown";
  std::string region = "Unknown";
  std::string country = "Unknown";
};

enum class LocationSource { User, Ip };

struct ResolvedLocation {
  Coordinate coordinate;
  std::string displayName;
  LocationSource source = LocationSource::User;
  std::optional<std::string> note;
  std::optional<IpLocation> ipLocation;
  // Failure reasons of providers tried before the one that answered
  std::vector<std::string> providerFailures;
};

// One sample of the OVATION grid: [longitude, latitude, probability]
struct GridPoint {
  double longitude = 0.0;
  double latitude = 0.0;
  double probability = 0.0;
};

struct AuroraSnapshot {
  double probability = 0.0;
  nlohmann::json kpIndex = "Unknown"; // string or number, as NOAA reports it
  Coordinate coordinate;
};

// --- Errors ---

// Coordinate bounds violated by the caller. No network call is attempted.
class ValidationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// A single geolocation provider failed. The provider chain moves on.
class RecoverableProviderError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Every geolocation provider failed.
class LocationUnavailableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A NOAA dataset fetch failed.
class NetworkError : public std::runtime_error {
public:
  NetworkError(const std::string &dataset, const std::string &cause)
      : std::runtime_error("Could not fetch " + dataset + " data: " + cause),
        dataset_(dataset) {}

  const std::string &dataset() const { return dataset_; }

private:
  std::string dataset_;
};

// --- JSON conversions (cache payloads) ---

inline void to_json(nlohmann::json &j, const IpLocation &l) {
  j = nlohmann::json{{"latitude", l.coordinate.latitude},
                     {"longitude", l.coordinate.longitude},
                     {"city", l.city},
                     {"region", l.region},
                     {"country", l.country}};
}

inline void from_json(const nlohmann::json &j, IpLocation &l) {
  j.at("latitude").get_to(l.coordinate.latitude);
  j.at("longitude").get_to(l.coordinate.longitude);
  l.city = j.value("city", "Unknown");
  l.region = j.value("region", "Unknown");
  l.country = j.value("country", "Unknown");
}

inline void to_json(nlohmann::json &j, const AuroraSnapshot &s) {
  j = nlohmann::json{{"probability", s.probability},
                     {"kp", s.kpIndex},
                     {"latitude", s.coordinate.latitude},
                     {"longitude", s.coordinate.longitude}};
}

inline void from_json(const nlohmann::json &j, AuroraSnapshot &s) {
  j.at("probability").get_to(s.probability);
  s.kpIndex = j.value("kp", nlohmann::json("Unknown"));
  j.at("latitude").get_to(s.coordinate.latitude);
  j.at("longitude").get_to(s.coordinate.longitude);
}
