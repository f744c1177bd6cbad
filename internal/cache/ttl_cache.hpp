#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace prdchat::cache {

/*
  Thread-safe string-keyed cache with per-entry expiry.

  The cache is never the source of truth: a miss or an expired entry
  tells the caller to read the repository and Put() the result back.
  Expired entries are invisible to Get() and reclaimed by Sweep().
*/
template <typename V>
class TtlCache {
 public:
  using Clock    = std::chrono::steady_clock;
  using Duration = std::chrono::milliseconds;
  using NowFn    = std::function<Clock::time_point()>;

  explicit TtlCache(Duration default_ttl, NowFn now = [] { return Clock::now(); })
      : default_ttl_(default_ttl), now_(std::move(now)) {
  }

  void Put(const std::string& key, V value) {
    Put(key, std::move(value), default_ttl_);
  }

  void Put(const std::string& key, V value, Duration ttl) {
    const auto expires_at = now_() + ttl;
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(key, Entry{std::move(value), expires_at});
  }

  std::optional<V> Get(const std::string& key) const {
    const auto       now = now_();
    std::shared_lock lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires_at <= now) {
      return std::nullopt;
    }
    return it->second.value;
  }

  void Remove(const std::string& key) {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
  }

  // Drops expired entries; returns how many were removed.
  std::size_t Sweep() {
    const auto       now = now_();
    std::unique_lock lock(mutex_);

    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.expires_at <= now) {
        it = entries_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  std::size_t Size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
  }

  Duration DefaultTtl() const {
    return default_ttl_;
  }

 private:
  struct Entry {
    V                 value;
    Clock::time_point expires_at;
  };

  Duration                               default_ttl_;
  NowFn                                  now_;
  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace prdchat::cache
