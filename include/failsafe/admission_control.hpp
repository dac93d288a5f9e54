#pragma once

#include "failsafe/types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace failsafe {

struct RateRule {
  std::uint64_t limit{60};
  std::chrono::seconds window{60};
};

struct AdmissionConfig {
  RateRule default_rule;
  // Keyed by route prefix; the longest matching prefix wins.
  std::map<std::string, RateRule> routes;
};

AdmissionConfig default_admission_config();

struct RateInfo {
  std::uint64_t limit{0};
  std::uint64_t remaining{0};
  std::uint64_t reset_seconds{0};
  std::uint64_t window_seconds{0};
};

struct AdmissionDecision {
  bool allowed{false};
  RateInfo info;
};

// Rolling-window limiter keyed by (client, route).
class AdmissionControl {
public:
  explicit AdmissionControl(AdmissionConfig cfg);

  AdmissionControl(const AdmissionControl &) = delete;
  AdmissionControl &operator=(const AdmissionControl &) = delete;

  AdmissionDecision check(const std::string &client_key,
                          const std::string &route);
  AdmissionDecision check(const std::string &client_key,
                          const std::string &route, TimePoint now);
  // Throws RateLimitExceeded on rejection.
  RateInfo enforce(const std::string &client_key, const std::string &route);

  RateRule rule_for(const std::string &route) const;

  // Drops windows whose timestamps have all aged out. Returns the number
  // dropped. check() also does this once per longest configured window.
  std::size_t sweep(TimePoint now);
  std::size_t tracked_windows() const;
  std::string info() const;

  static std::string client_identity(const std::string &address,
                                     const std::string &user_agent);
  static std::vector<std::pair<std::string, std::string>>
  headers(const RateInfo &info);

private:
  struct Window {
    std::deque<TimePoint> stamps;
    std::chrono::seconds span{0};
  };

  std::size_t sweep_locked(TimePoint now);

  AdmissionConfig cfg_;
  std::chrono::seconds sweep_interval_;
  TimePoint last_sweep_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Window> windows_;
  std::uint64_t allowed_{0};
  std::uint64_t rejected_{0};
};

} // namespace failsafe
