#pragma once

#include "failsafe/expiring_cache.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace failsafe {

struct FetchOptions {
  std::optional<Millis> ttl;
  std::string prefix;
  bool skip_empty{true};
};

struct FetchStats {
  std::uint64_t cache_hits{0};
  std::uint64_t computations{0};
  std::uint64_t coalesced{0};
  std::uint64_t failures{0};
  // Leaders cancelled by their caller; waiters retry instead of failing.
  std::uint64_t cancelled{0};
  std::size_t in_flight{0};
};

using ComputeFn = std::function<std::optional<Value>()>;

// Runs at most one computation per missing key; concurrent callers for the
// same key wait on the leader's shared future. A computation failure reaches
// every waiter. An OperationCancelled only reaches the leader, and the
// waiters compete for the key again.
class FetchManager {
public:
  explicit FetchManager(ExpiringCache &cache);

  FetchManager(const FetchManager &) = delete;
  FetchManager &operator=(const FetchManager &) = delete;

  std::optional<Value> get_or_fetch(const std::string &key,
                                    const ComputeFn &compute,
                                    const FetchOptions &opts = {});

  std::size_t invalidate_prefix(const std::string &prefix);

  FetchStats stats() const;
  std::string info() const;

  static std::string full_key(const std::string &key,
                              const FetchOptions &opts);

private:
  using SharedResult = std::shared_future<std::optional<Value>>;

  ExpiringCache &cache_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, SharedResult> pending_;
  FetchStats stats_{};
};

} // namespace failsafe
