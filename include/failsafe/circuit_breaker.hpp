#pragma once

#include "failsafe/errors.hpp"
#include "failsafe/types.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace failsafe {

enum class CircuitState { Closed, Open, HalfOpen };

const char *to_string(CircuitState state);

struct BreakerConfig {
  std::uint32_t failure_threshold{5};
  std::uint32_t success_threshold{3};
  Millis timeout{std::chrono::seconds(30)};
  std::uint32_t half_open_max_calls{3};
};

// Thresholds are at least 1 and the trial budget is never smaller than the
// number of successes needed to close.
BreakerConfig normalized(BreakerConfig cfg);

struct CircuitStats {
  std::uint64_t total_calls{0};
  std::uint64_t successful_calls{0};
  std::uint64_t failed_calls{0};
  std::uint32_t consecutive_failures{0};
  std::uint32_t consecutive_successes{0};
  std::optional<TimePoint> last_failure_time;
  std::uint64_t rejected_calls{0};
};

struct BreakerStatus {
  std::string name;
  CircuitState state{CircuitState::Closed};
  std::uint64_t total_calls{0};
  std::uint64_t successful_calls{0};
  std::uint64_t failed_calls{0};
  std::uint32_t consecutive_failures{0};
  double failure_rate{0.0};
  std::uint64_t rejected_calls{0};
};

struct Admission {
  bool admitted{false};
  std::string reason;

  static Admission allow() { return {true, {}}; }
  static Admission reject(std::string why) { return {false, std::move(why)}; }
};

// CLOSED -> OPEN after failure_threshold consecutive failures.
// OPEN -> HALF_OPEN once timeout has passed since the last failure.
// HALF_OPEN -> CLOSED after success_threshold consecutive successes.
// HALF_OPEN -> OPEN on any failure.
class CircuitBreaker {
public:
  CircuitBreaker(std::string name, BreakerConfig cfg);

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  // Runs fn if the breaker admits it and records the outcome. Throws
  // CircuitOpenError without calling fn on rejection; fn's own exception is
  // rethrown unchanged after it is counted.
  template <typename Fn> std::invoke_result_t<Fn &> call(Fn &&fn) {
    const Admission admission = try_acquire();
    if (!admission.admitted)
      throw CircuitOpenError(name_);
    return run_admitted(fn);
  }

  // Same as call(fn), but a rejected call returns fallback() instead of
  // throwing. Failures of fn still propagate.
  template <typename Fn, typename Fallback>
  std::invoke_result_t<Fn &> call(Fn &&fn, Fallback &&fallback) {
    const Admission admission = try_acquire();
    if (!admission.admitted)
      return fallback();
    return run_admitted(fn);
  }

  // False only while OPEN with the cool-down still running.
  bool available() const;
  CircuitState state() const;
  CircuitStats stats() const;
  BreakerStatus status() const;

  const std::string &name() const { return name_; }
  const BreakerConfig &config() const { return cfg_; }

  void reset();
  void force_state(CircuitState state);

private:
  template <typename Fn> std::invoke_result_t<Fn &> run_admitted(Fn &fn) {
    using Result = std::invoke_result_t<Fn &>;
    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        on_success();
      } else {
        Result result = fn();
        on_success();
        return result;
      }
    } catch (const OperationCancelled &) {
      on_abandon();
      throw;
    } catch (const std::exception &e) {
      on_failure(e.what());
      throw;
    } catch (...) {
      on_failure("non-standard exception");
      throw;
    }
  }

  Admission try_acquire();
  void on_success();
  void on_failure(const std::string &reason);
  void on_abandon();
  void transition_locked(CircuitState to, const std::string &why);

  const std::string name_;
  const BreakerConfig cfg_;
  mutable std::mutex mu_;
  CircuitState state_{CircuitState::Closed};
  CircuitStats stats_{};
  std::uint32_t half_open_calls_{0};
};

class CircuitRegistry {
public:
  explicit CircuitRegistry(BreakerConfig default_config = {});

  CircuitRegistry(const CircuitRegistry &) = delete;
  CircuitRegistry &operator=(const CircuitRegistry &) = delete;

  std::shared_ptr<CircuitBreaker> get_or_create(const std::string &name);
  // cfg only applies when the breaker does not exist yet.
  std::shared_ptr<CircuitBreaker> get_or_create(const std::string &name,
                                                const BreakerConfig &cfg);
  std::shared_ptr<CircuitBreaker> find(const std::string &name) const;

  // Affects breakers created after the call.
  void set_config(const std::string &name, const BreakerConfig &cfg);

  std::vector<BreakerStatus> all_status() const;
  void reset_all();
  std::size_t size() const;
  std::string info() const;

private:
  BreakerConfig config_for(const std::string &name) const;

  BreakerConfig default_config_;
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
  std::unordered_map<std::string, BreakerConfig> overrides_;
};

} // namespace failsafe
