#pragma once

#include "failsafe/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace failsafe {

struct CacheConfig {
  std::size_t max_size{1000};
  Millis default_ttl{std::chrono::seconds(300)};
  std::size_t max_key_len{512};
};

struct CacheStats {
  std::size_t size{0};
  std::size_t max_size{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};

  double hit_rate() const {
    const auto total = hits + misses;
    return total == 0 ? 0.0
                      : static_cast<double>(hits) / static_cast<double>(total);
  }
};

struct CacheEntry {
  Value value;
  TimePoint created_at{};
  TimePoint expires_at{};
};

// Bounded key/value store with per-entry TTL and least-recently-used
// eviction. Every public operation takes the same lock.
class ExpiringCache {
public:
  explicit ExpiringCache(CacheConfig cfg);

  ExpiringCache(const ExpiringCache &) = delete;
  ExpiringCache &operator=(const ExpiringCache &) = delete;

  std::optional<Value> get(const std::string &key);
  bool set(const std::string &key, Value value, std::string *err = nullptr);
  bool set(const std::string &key, Value value, Millis ttl,
           std::string *err = nullptr);
  bool invalidate(const std::string &key);
  std::size_t invalidate_prefix(const std::string &prefix);
  void clear();

  // Peeks without touching recency or hit accounting.
  bool contains(const std::string &key) const;
  std::size_t size() const;
  std::size_t max_size() const { return cfg_.max_size; }
  Millis default_ttl() const { return cfg_.default_ttl; }

  CacheStats stats() const;
  std::string info() const;

private:
  struct Slot {
    CacheEntry entry;
    std::list<std::string>::iterator lru_pos;
    std::uint64_t generation{0};
  };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  using SlotMap = std::unordered_map<std::string, Slot>;

  void erase_locked(SlotMap::iterator it, bool eviction, bool expiration);
  void purge_expired_locked(TimePoint now);
  void evict_for_insert_locked();
  void compact_heap_locked();

  CacheConfig cfg_;
  mutable std::mutex mu_;
  SlotMap slots_;
  std::list<std::string> lru_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::uint64_t next_generation_{0};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t evictions_{0};
  std::uint64_t expirations_{0};
};

} // namespace failsafe
