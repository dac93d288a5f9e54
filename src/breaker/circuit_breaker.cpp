#include "failsafe/circuit_breaker.hpp"

#include "failsafe/log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace failsafe {

const char *to_string(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half_open";
  }
  return "unknown";
}

BreakerConfig normalized(BreakerConfig cfg) {
  cfg.failure_threshold = std::max<std::uint32_t>(1, cfg.failure_threshold);
  cfg.success_threshold = std::max<std::uint32_t>(1, cfg.success_threshold);
  cfg.half_open_max_calls =
      std::max(cfg.success_threshold, cfg.half_open_max_calls);
  if (cfg.timeout < Millis::zero())
    cfg.timeout = Millis::zero();
  return cfg;
}

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig cfg)
    : name_(std::move(name)), cfg_(normalized(cfg)) {}

Admission CircuitBreaker::try_acquire() {
  std::lock_guard<std::mutex> lock(mu_);
  switch (state_) {
  case CircuitState::Closed:
    return Admission::allow();
  case CircuitState::Open: {
    const auto since = stats_.last_failure_time
                           ? Clock::now() - *stats_.last_failure_time
                           : Clock::duration::max();
    if (since >= cfg_.timeout) {
      transition_locked(CircuitState::HalfOpen, "cool-down elapsed");
      ++half_open_calls_;
      return Admission::allow();
    }
    ++stats_.rejected_calls;
    return Admission::reject("open");
  }
  case CircuitState::HalfOpen:
    if (half_open_calls_ < cfg_.half_open_max_calls) {
      ++half_open_calls_;
      return Admission::allow();
    }
    ++stats_.rejected_calls;
    return Admission::reject("half-open trial budget exhausted");
  }
  return Admission::reject("unknown state");
}

void CircuitBreaker::on_success() {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.total_calls;
  ++stats_.successful_calls;
  stats_.consecutive_failures = 0;
  ++stats_.consecutive_successes;
  if (state_ == CircuitState::HalfOpen &&
      stats_.consecutive_successes >= cfg_.success_threshold)
    transition_locked(CircuitState::Closed, "service recovered");
}

void CircuitBreaker::on_failure(const std::string &reason) {
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.total_calls;
  ++stats_.failed_calls;
  ++stats_.consecutive_failures;
  stats_.consecutive_successes = 0;
  stats_.last_failure_time = Clock::now();
  if (state_ == CircuitState::HalfOpen) {
    transition_locked(CircuitState::Open, "failure in half-open: " + reason);
  } else if (state_ == CircuitState::Closed &&
             stats_.consecutive_failures >= cfg_.failure_threshold) {
    transition_locked(CircuitState::Open, "threshold reached: " + reason);
  }
}

void CircuitBreaker::on_abandon() {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ == CircuitState::HalfOpen && half_open_calls_ > 0)
    --half_open_calls_;
}

void CircuitBreaker::transition_locked(CircuitState to,
                                       const std::string &why) {
  const CircuitState from = state_;
  state_ = to;
  switch (to) {
  case CircuitState::HalfOpen:
    half_open_calls_ = 0;
    stats_.consecutive_successes = 0;
    break;
  case CircuitState::Closed:
    half_open_calls_ = 0;
    stats_.consecutive_failures = 0;
    stats_.consecutive_successes = 0;
    break;
  case CircuitState::Open:
    half_open_calls_ = 0;
    break;
  }
  if (from == to)
    return;
  log(to == CircuitState::Open ? LogLevel::Warn : LogLevel::Info, "breaker",
      "'" + name_ + "' " + to_string(from) + " -> " + to_string(to) + " (" +
          why + ")");
}

bool CircuitBreaker::available() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ != CircuitState::Open)
    return true;
  if (!stats_.last_failure_time)
    return true;
  return Clock::now() - *stats_.last_failure_time >= cfg_.timeout;
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

CircuitStats CircuitBreaker::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

BreakerStatus CircuitBreaker::status() const {
  std::lock_guard<std::mutex> lock(mu_);
  BreakerStatus s;
  s.name = name_;
  s.state = state_;
  s.total_calls = stats_.total_calls;
  s.successful_calls = stats_.successful_calls;
  s.failed_calls = stats_.failed_calls;
  s.consecutive_failures = stats_.consecutive_failures;
  const double rate = static_cast<double>(stats_.failed_calls) /
                      static_cast<double>(std::max<std::uint64_t>(
                          stats_.total_calls, 1)) *
                      100.0;
  s.failure_rate = std::round(rate * 100.0) / 100.0;
  s.rejected_calls = stats_.rejected_calls;
  return s;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mu_);
  stats_ = CircuitStats{};
  transition_locked(CircuitState::Closed, "manual reset");
  log(LogLevel::Info, "breaker", "'" + name_ + "' manually reset");
}

void CircuitBreaker::force_state(CircuitState state) {
  std::lock_guard<std::mutex> lock(mu_);
  if (state == CircuitState::Open)
    stats_.last_failure_time = Clock::now();
  transition_locked(state, "forced");
}

CircuitRegistry::CircuitRegistry(BreakerConfig default_config)
    : default_config_(normalized(default_config)) {}

std::shared_ptr<CircuitBreaker>
CircuitRegistry::get_or_create(const std::string &name) {
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = breakers_.find(name);
    if (it != breakers_.end())
      return it->second;
  }
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto [it, inserted] = breakers_.try_emplace(name, nullptr);
  if (inserted)
    it->second = std::make_shared<CircuitBreaker>(name, config_for(name));
  return it->second;
}

std::shared_ptr<CircuitBreaker>
CircuitRegistry::get_or_create(const std::string &name,
                               const BreakerConfig &cfg) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto [it, inserted] = breakers_.try_emplace(name, nullptr);
  if (inserted)
    it->second = std::make_shared<CircuitBreaker>(name, cfg);
  return it->second;
}

std::shared_ptr<CircuitBreaker>
CircuitRegistry::find(const std::string &name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = breakers_.find(name);
  return it == breakers_.end() ? nullptr : it->second;
}

void CircuitRegistry::set_config(const std::string &name,
                                 const BreakerConfig &cfg) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  overrides_[name] = normalized(cfg);
}

BreakerConfig CircuitRegistry::config_for(const std::string &name) const {
  auto it = overrides_.find(name);
  return it == overrides_.end() ? default_config_ : it->second;
}

std::vector<BreakerStatus> CircuitRegistry::all_status() const {
  std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    snapshot.reserve(breakers_.size());
    for (const auto &[name, breaker] : breakers_)
      snapshot.push_back(breaker);
  }
  std::vector<BreakerStatus> out;
  out.reserve(snapshot.size());
  for (const auto &b : snapshot)
    out.push_back(b->status());
  std::sort(out.begin(), out.end(),
            [](const auto &a, const auto &b) { return a.name < b.name; });
  return out;
}

void CircuitRegistry::reset_all() {
  std::vector<std::shared_ptr<CircuitBreaker>> snapshot;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    for (const auto &[name, breaker] : breakers_)
      snapshot.push_back(breaker);
  }
  for (const auto &b : snapshot)
    b->reset();
}

std::size_t CircuitRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return breakers_.size();
}

std::string CircuitRegistry::info() const {
  std::ostringstream os;
  os << "breakers:" << size() << "\n";
  for (const auto &s : all_status()) {
    os << "breaker." << s.name << ":state=" << to_string(s.state)
       << ",total=" << s.total_calls << ",ok=" << s.successful_calls
       << ",failed=" << s.failed_calls
       << ",consecutive_failures=" << s.consecutive_failures
       << ",failure_rate=" << s.failure_rate
       << ",rejected=" << s.rejected_calls << "\n";
  }
  return os.str();
}

} // namespace failsafe
