#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct CacheStats {
  std::size_t size = 0;
  std::size_t capacity = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
  double hitRate = 0.0;    // percent, one decimal
  std::string hitRateText; // e.g. "66.7%"
  std::vector<std::string> keys; // least recently used first
};

// Key -> JSON payload store with a global LRU bound. The TTL is supplied on
// every read, so one instance serves datasets with different staleness
// tolerances. Expired entries are dropped lazily when read.
//
// All public methods lock one mutex; get() mutates too (recency, counters).
class TtlLruCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit TtlLruCache(std::size_t capacity, NowFn now = Clock::now);

  std::optional<nlohmann::json> get(const std::string &key, int ttlSeconds);

  void set(const std::string &key, nlohmann::json value);

  void clear();

  CacheStats stats() const;

  // Read-through: returns the cached value, or calls fetch() and stores its
  // result. The lock is not held while fetch() runs; if it throws, nothing is
  // stored.
  nlohmann::json getOrFetch(const std::string &key, int ttlSeconds,
                            const std::function<nlohmann::json()> &fetch);

  std::size_t capacity() const { return capacity_; }

private:
  struct CacheEntry {
    nlohmann::json value;
    Clock::time_point storedAt;
    std::list<std::string>::iterator order;
  };

  void evictLocked();

  const std::size_t capacity_;
  NowFn now_;

  mutable std::mutex mutex_;
  std::list<std::string> order_; // front = least recently used
  std::unordered_map<std::string, CacheEntry> entries_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};
