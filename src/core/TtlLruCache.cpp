#include "TtlLruCache.h"

#include "Logger.h"

#include <cmath>
#include <stdexcept>

TtlLruCache::TtlLruCache(std::size_t capacity, NowFn now)
    : capacity_(capacity), now_(std::move(now)) {
  if (capacity_ == 0)
    throw std::invalid_argument("cache capacity must be greater than zero");
}

std::optional<nlohmann::json> TtlLruCache::get(const std::string &key,
                                               int ttlSeconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }

  auto age = now_() - it->second.storedAt;
  if (age > std::chrono::seconds(ttlSeconds)) {
    order_.erase(it->second.order);
    entries_.erase(it);
    ++misses_;
    LOG_D("Cache", "Expired {}", key);
    return std::nullopt;
  }

  // Move to most recently used
  order_.splice(order_.end(), order_, it->second.order);
  ++hits_;
  return it->second.value;
}

void TtlLruCache::set(const std::string &key, nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    order_.erase(it->second.order);
    entries_.erase(it);
  }

  auto pos = order_.insert(order_.end(), key);
  entries_.emplace(key, CacheEntry{std::move(value), now_(), pos});
  evictLocked();
}

void TtlLruCache::evictLocked() {
  while (entries_.size() > capacity_) {
    const std::string &oldest = order_.front();
    LOG_D("Cache", "Evicting {}", oldest);
    entries_.erase(oldest);
    order_.pop_front();
  }
}

void TtlLruCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  order_.clear();
  hits_ = 0;
  misses_ = 0;
}

CacheStats TtlLruCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CacheStats s;
  s.size = entries_.size();
  s.capacity = capacity_;
  s.hits = hits_;
  s.misses = misses_;

  std::size_t total = hits_ + misses_;
  double rate =
      total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) * 100.0
                : 0.0;
  s.hitRate = std::round(rate * 10.0) / 10.0;
  s.hitRateText = fmt::format("{:.1f}%", rate);
  s.keys.assign(order_.begin(), order_.end());
  return s;
}

nlohmann::json
TtlLruCache::getOrFetch(const std::string &key, int ttlSeconds,
                        const std::function<nlohmann::json()> &fetch) {
  if (auto cached = get(key, ttlSeconds)) {
    LOG_D("Cache", "Hit {}", key);
    return *cached;
  }

  LOG_D("Cache", "Miss {}, fetching", key);
  nlohmann::json value = fetch();
  set(key, value);
  return value;
}
