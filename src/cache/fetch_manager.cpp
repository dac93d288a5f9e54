#include "failsafe/fetch_manager.hpp"

#include "failsafe/errors.hpp"
#include "failsafe/log.hpp"

#include <exception>
#include <sstream>

namespace failsafe {
namespace {
// Handed to waiters when the leader was cancelled by its own caller.
struct LeaderCancelled {};
} // namespace

FetchManager::FetchManager(ExpiringCache &cache) : cache_(cache) {}

std::string FetchManager::full_key(const std::string &key,
                                   const FetchOptions &opts) {
  return opts.prefix.empty() ? key : opts.prefix + ":" + key;
}

std::optional<Value> FetchManager::get_or_fetch(const std::string &key,
                                                const ComputeFn &compute,
                                                const FetchOptions &opts) {
  const std::string cache_key = full_key(key, opts);
  while (true) {
    if (auto hit = cache_.get(cache_key)) {
      std::lock_guard<std::mutex> lock(mu_);
      ++stats_.cache_hits;
      return hit;
    }

    std::promise<std::optional<Value>> promise;
    std::optional<SharedResult> waiter;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = pending_.find(cache_key);
      if (it != pending_.end()) {
        ++stats_.coalesced;
        waiter = it->second;
      } else if (cache_.contains(cache_key)) {
        // The leader finished between our miss and taking the lock.
        if (auto hit = cache_.get(cache_key)) {
          ++stats_.cache_hits;
          return hit;
        }
      }
      if (!waiter) {
        pending_.emplace(cache_key, promise.get_future().share());
        ++stats_.computations;
        stats_.in_flight = pending_.size();
      }
    }
    if (waiter) {
      try {
        return waiter->get();
      } catch (const LeaderCancelled &) {
        // The leader gave up on its own behalf; compete for the key again.
        continue;
      }
    }

    std::optional<Value> result;
    try {
      result = compute();
    } catch (const OperationCancelled &) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        pending_.erase(cache_key);
        ++stats_.cancelled;
        stats_.in_flight = pending_.size();
      }
      promise.set_exception(std::make_exception_ptr(LeaderCancelled{}));
      throw;
    } catch (...) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        pending_.erase(cache_key);
        ++stats_.failures;
        stats_.in_flight = pending_.size();
      }
      promise.set_exception(std::current_exception());
      throw;
    }

    const bool empty = !result.has_value() || result->empty();
    if (!empty || !opts.skip_empty) {
      std::string err;
      Value stored_value = result.value_or(Value{});
      const bool stored =
          opts.ttl
              ? cache_.set(cache_key, std::move(stored_value), *opts.ttl, &err)
              : cache_.set(cache_key, std::move(stored_value), &err);
      if (!stored)
        log(LogLevel::Warn, "fetch", "not cached '" + cache_key + "': " + err);
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      pending_.erase(cache_key);
      stats_.in_flight = pending_.size();
    }
    promise.set_value(result);
    return result;
  }
}

std::size_t FetchManager::invalidate_prefix(const std::string &prefix) {
  const auto removed = cache_.invalidate_prefix(prefix);
  log(LogLevel::Info, "fetch",
      "invalidated " + std::to_string(removed) + " entries with prefix '" +
          prefix + "'");
  return removed;
}

FetchStats FetchManager::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

std::string FetchManager::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "fetch_cache_hits:" << s.cache_hits << "\n";
  os << "fetch_computations:" << s.computations << "\n";
  os << "fetch_coalesced:" << s.coalesced << "\n";
  os << "fetch_failures:" << s.failures << "\n";
  os << "fetch_cancelled:" << s.cancelled << "\n";
  os << "fetch_in_flight:" << s.in_flight << "\n";
  return os.str();
}

} // namespace failsafe
