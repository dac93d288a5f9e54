#include "failsafe/admission_control.hpp"

#include "failsafe/errors.hpp"

#include <algorithm>
#include <sstream>

namespace failsafe {
namespace {
std::string window_key(const std::string &client, const std::string &route) {
  return client + '\n' + route;
}

void prune(std::deque<TimePoint> &stamps, TimePoint cutoff) {
  while (!stamps.empty() && stamps.front() <= cutoff)
    stamps.pop_front();
}

std::uint64_t seconds_until(TimePoint from, TimePoint to) {
  if (to <= from)
    return 0;
  return static_cast<std::uint64_t>(
      std::chrono::ceil<std::chrono::seconds>(to - from).count());
}
} // namespace

AdmissionConfig default_admission_config() {
  AdmissionConfig cfg;
  cfg.default_rule = {60, std::chrono::seconds(60)};
  cfg.routes["/api/chat/message"] = {30, std::chrono::seconds(60)};
  cfg.routes["/api/upload/"] = {10, std::chrono::seconds(60)};
  cfg.routes["/api/training/"] = {60, std::chrono::seconds(60)};
  return cfg;
}

AdmissionControl::AdmissionControl(AdmissionConfig cfg)
    : cfg_(std::move(cfg)), sweep_interval_(cfg_.default_rule.window),
      last_sweep_(Clock::now()) {
  for (const auto &[prefix, rule] : cfg_.routes)
    sweep_interval_ = std::max(sweep_interval_, rule.window);
  sweep_interval_ = std::max(sweep_interval_, std::chrono::seconds(1));
}

RateRule AdmissionControl::rule_for(const std::string &route) const {
  const RateRule *best = nullptr;
  std::size_t best_len = 0;
  for (const auto &[prefix, rule] : cfg_.routes) {
    if (route.compare(0, prefix.size(), prefix) != 0)
      continue;
    if (!best || prefix.size() > best_len) {
      best = &rule;
      best_len = prefix.size();
    }
  }
  return best ? *best : cfg_.default_rule;
}

AdmissionDecision AdmissionControl::check(const std::string &client_key,
                                          const std::string &route) {
  return check(client_key, route, Clock::now());
}

AdmissionDecision AdmissionControl::check(const std::string &client_key,
                                          const std::string &route,
                                          TimePoint now) {
  const RateRule rule = rule_for(route);
  AdmissionDecision d;
  d.info.limit = rule.limit;
  d.info.window_seconds = static_cast<std::uint64_t>(rule.window.count());

  std::lock_guard<std::mutex> lock(mu_);
  // Once per longest window, idle clients are dropped.
  if (now - last_sweep_ >= sweep_interval_) {
    sweep_locked(now);
    last_sweep_ = now;
  }

  const auto key = window_key(client_key, route);
  auto it = windows_.find(key);
  if (it != windows_.end())
    prune(it->second.stamps, now - rule.window);
  const std::size_t count = it == windows_.end() ? 0 : it->second.stamps.size();

  if (count >= rule.limit) {
    ++rejected_;
    d.allowed = false;
    d.info.remaining = 0;
    d.info.reset_seconds =
        count == 0 ? d.info.window_seconds
                   : seconds_until(now, it->second.stamps.front() + rule.window);
    if (it != windows_.end() && count == 0)
      windows_.erase(it);
    return d;
  }

  if (it == windows_.end())
    it = windows_.emplace(key, Window{}).first;
  it->second.span = rule.window;
  auto &stamps = it->second.stamps;

  stamps.push_back(now);
  ++allowed_;
  d.allowed = true;
  d.info.remaining = rule.limit - stamps.size();
  d.info.reset_seconds = seconds_until(now, stamps.front() + rule.window);
  return d;
}

RateInfo AdmissionControl::enforce(const std::string &client_key,
                                   const std::string &route) {
  const auto d = check(client_key, route);
  if (!d.allowed)
    throw RateLimitExceeded(d.info.limit, d.info.reset_seconds);
  return d.info;
}

std::size_t AdmissionControl::sweep(TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  last_sweep_ = now;
  return sweep_locked(now);
}

std::size_t AdmissionControl::sweep_locked(TimePoint now) {
  std::size_t dropped = 0;
  for (auto it = windows_.begin(); it != windows_.end();) {
    prune(it->second.stamps, now - it->second.span);
    if (it->second.stamps.empty()) {
      it = windows_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

std::size_t AdmissionControl::tracked_windows() const {
  std::lock_guard<std::mutex> lock(mu_);
  return windows_.size();
}

std::string AdmissionControl::info() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream os;
  os << "admission_allowed:" << allowed_ << "\n";
  os << "admission_rejected:" << rejected_ << "\n";
  os << "admission_windows:" << windows_.size() << "\n";
  return os.str();
}

std::string AdmissionControl::client_identity(const std::string &address,
                                              const std::string &user_agent) {
  const std::string addr = address.empty() ? "127.0.0.1" : address;
  const std::string ua = user_agent.substr(0, 100);
  return addr + ":" + std::to_string(fnv1a(ua) % 10000);
}

std::vector<std::pair<std::string, std::string>>
AdmissionControl::headers(const RateInfo &info) {
  return {{"X-RateLimit-Limit", std::to_string(info.limit)},
          {"X-RateLimit-Remaining", std::to_string(info.remaining)},
          {"X-RateLimit-Reset", std::to_string(info.reset_seconds)}};
}

} // namespace failsafe
