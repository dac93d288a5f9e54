#include "catch2/catch_test_macros.hpp"
#include "failsafe/admission_control.hpp"
#include "failsafe/circuit_breaker.hpp"
#include "failsafe/expiring_cache.hpp"
#include "failsafe/fetch_manager.hpp"
#include "failsafe/log.hpp"

#include <atomic>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("cache churn keeps capacity and accounting", "[chaos]") {
  failsafe::ExpiringCache c({256, 50ms, 64});
  std::mt19937_64 rng(42);
  for (int i = 0; i < 20000; ++i) {
    const auto key = std::string("k") + std::to_string(rng() % 2000);
    switch (rng() % 5) {
    case 0:
      c.set(key, std::string(rng() % 64 + 1, 'a'));
      break;
    case 1:
      c.set(key, "short", failsafe::Millis(static_cast<long>(rng() % 3)));
      break;
    case 2:
      c.get(key);
      break;
    case 3:
      c.invalidate(key);
      break;
    default:
      c.invalidate_prefix("k1");
      break;
    }
  }
  REQUIRE(c.size() <= 256);
  const auto s = c.stats();
  REQUIRE(s.size == c.size());
}

TEST_CASE("concurrent fetch churn settles with nothing in flight",
          "[chaos]") {
  const auto prev = failsafe::log_level();
  failsafe::set_log_level(failsafe::LogLevel::Off);
  failsafe::ExpiringCache cache({128, 20ms, 64});
  failsafe::FetchManager fm(cache);
  std::atomic<int> bad{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937_64 rng(static_cast<std::uint64_t>(t) + 1);
      for (int i = 0; i < 2000; ++i) {
        const auto key = std::to_string(rng() % 64);
        const bool fail = rng() % 7 == 0;
        try {
          auto v = fm.get_or_fetch(
              key, [&]() -> std::optional<failsafe::Value> {
                if (fail)
                  throw std::runtime_error("flaky");
                return "v" + key;
              });
          if (!v || *v != "v" + key)
            ++bad;
        } catch (const std::runtime_error &) {
        }
      }
    });
  }
  for (auto &w : workers)
    w.join();
  failsafe::set_log_level(prev);
  REQUIRE(bad.load() == 0);
  REQUIRE(fm.stats().in_flight == 0);
  REQUIRE(cache.size() <= 128);
}

TEST_CASE("breaker and limiter stay consistent under contention", "[chaos]") {
  const auto prev = failsafe::log_level();
  failsafe::set_log_level(failsafe::LogLevel::Off);
  failsafe::CircuitBreaker cb("chaos", {3, 2, 5ms, 4});
  failsafe::AdmissionConfig cfg;
  cfg.default_rule = {500, std::chrono::seconds(60)};
  failsafe::AdmissionControl ac(cfg);
  std::atomic<std::uint64_t> admitted{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937_64 rng(static_cast<std::uint64_t>(t) * 7 + 3);
      for (int i = 0; i < 1000; ++i) {
        if (ac.check("shared", "/x").allowed)
          ++admitted;
        try {
          cb.call([&] {
            if (rng() % 3 == 0)
              throw std::runtime_error("fail");
          });
        } catch (const std::exception &) {
        }
      }
    });
  }
  for (auto &w : workers)
    w.join();
  failsafe::set_log_level(prev);
  REQUIRE(admitted.load() == 500);
  const auto s = cb.stats();
  REQUIRE(s.total_calls == s.successful_calls + s.failed_calls);
  REQUIRE(s.total_calls + s.rejected_calls == 8000);
}
