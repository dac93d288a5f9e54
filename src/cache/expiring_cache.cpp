#include "failsafe/expiring_cache.hpp"

#include <algorithm>
#include <sstream>

namespace failsafe {

ExpiringCache::ExpiringCache(CacheConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.max_size == 0)
    cfg_.max_size = 1;
  if (cfg_.max_key_len == 0)
    cfg_.max_key_len = 1;
}

std::optional<Value> ExpiringCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (it->second.entry.expires_at <= Clock::now()) {
    erase_locked(it, false, true);
    ++misses_;
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  ++hits_;
  return it->second.entry.value;
}

bool ExpiringCache::set(const std::string &key, Value value,
                        std::string *err) {
  return set(key, std::move(value), cfg_.default_ttl, err);
}

bool ExpiringCache::set(const std::string &key, Value value, Millis ttl,
                        std::string *err) {
  if (key.empty() || key.size() > cfg_.max_key_len) {
    if (err)
      *err = "invalid key length";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  const auto now = Clock::now();
  purge_expired_locked(now);

  if (ttl <= Millis::zero()) {
    auto existing = slots_.find(key);
    if (existing != slots_.end())
      erase_locked(existing, false, true);
    return true;
  }

  auto it = slots_.find(key);
  if (it == slots_.end()) {
    evict_for_insert_locked();
    lru_.push_front(key);
    it = slots_.emplace(key, Slot{}).first;
    it->second.lru_pos = lru_.begin();
  } else {
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
  }

  auto &slot = it->second;
  slot.entry.value = std::move(value);
  slot.entry.created_at = now;
  slot.entry.expires_at = now + ttl;
  slot.generation = ++next_generation_;
  expiry_heap_.push({slot.entry.expires_at, key, slot.generation});
  compact_heap_locked();
  return true;
}

bool ExpiringCache::invalidate(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end())
    return false;
  erase_locked(it, false, false);
  return true;
}

std::size_t ExpiringCache::invalidate_prefix(const std::string &prefix) {
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t removed = 0;
  for (auto it = slots_.begin(); it != slots_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      lru_.erase(it->second.lru_pos);
      it = slots_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void ExpiringCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  slots_.clear();
  lru_.clear();
  expiry_heap_ = {};
}

bool ExpiringCache::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = slots_.find(key);
  return it != slots_.end() && it->second.entry.expires_at > Clock::now();
}

std::size_t ExpiringCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return slots_.size();
}

CacheStats ExpiringCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  CacheStats s;
  s.size = slots_.size();
  s.max_size = cfg_.max_size;
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  s.expirations = expirations_;
  return s;
}

std::string ExpiringCache::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "cache_size:" << s.size << "\n";
  os << "cache_max_size:" << s.max_size << "\n";
  os << "cache_hits:" << s.hits << "\n";
  os << "cache_misses:" << s.misses << "\n";
  os << "cache_hit_rate:" << s.hit_rate() << "\n";
  os << "cache_evictions:" << s.evictions << "\n";
  os << "cache_expirations:" << s.expirations << "\n";
  return os.str();
}

void ExpiringCache::erase_locked(SlotMap::iterator it, bool eviction,
                                 bool expiration) {
  lru_.erase(it->second.lru_pos);
  slots_.erase(it);
  if (eviction)
    ++evictions_;
  if (expiration)
    ++expirations_;
}

void ExpiringCache::purge_expired_locked(TimePoint now) {
  while (!expiry_heap_.empty()) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = slots_.find(key);
    if (it == slots_.end() || it->second.generation != gen)
      continue;
    erase_locked(it, false, true);
  }
}

void ExpiringCache::evict_for_insert_locked() {
  while (!lru_.empty() && slots_.size() >= cfg_.max_size) {
    auto it = slots_.find(lru_.back());
    if (it == slots_.end()) {
      lru_.pop_back();
      continue;
    }
    erase_locked(it, true, false);
  }
}

// Overwrites and invalidations leave stale heap nodes behind; rebuild once
// they dominate.
void ExpiringCache::compact_heap_locked() {
  if (expiry_heap_.size() <= 4 * slots_.size() + 64)
    return;
  std::vector<ExpiryNode> live;
  live.reserve(slots_.size());
  for (const auto &[key, slot] : slots_)
    live.push_back({slot.entry.expires_at, key, slot.generation});
  expiry_heap_ = decltype(expiry_heap_)(std::greater<ExpiryNode>(),
                                        std::move(live));
}

} // namespace failsafe
