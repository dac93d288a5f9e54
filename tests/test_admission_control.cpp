#include "failsafe/admission_control.hpp"
#include "failsafe/errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace failsafe;
using namespace std::chrono_literals;

namespace {
AdmissionConfig small_config() {
  AdmissionConfig cfg;
  cfg.default_rule = {3, 60s};
  cfg.routes["/api/upload/"] = {1, 10s};
  cfg.routes["/api/upload/bulk"] = {5, 10s};
  return cfg;
}
} // namespace

TEST_CASE("Window rejects past the limit and recovers", "[admission]") {
  AdmissionControl ac(small_config());
  const TimePoint t0 = Clock::now();

  auto d1 = ac.check("c", "/x", t0);
  CHECK(d1.allowed);
  CHECK(d1.info.limit == 3);
  CHECK(d1.info.remaining == 2);
  CHECK(d1.info.window_seconds == 60);
  CHECK(d1.info.reset_seconds == 60);

  CHECK(ac.check("c", "/x", t0 + 1s).info.remaining == 1);
  CHECK(ac.check("c", "/x", t0 + 2s).info.remaining == 0);

  const auto denied = ac.check("c", "/x", t0 + 3s);
  CHECK_FALSE(denied.allowed);
  CHECK(denied.info.remaining == 0);
  CHECK(denied.info.reset_seconds == 57);
  CHECK(denied.info.reset_seconds <= 60);

  CHECK(ac.check("c", "/x", t0 + 61s).allowed);
}

TEST_CASE("Burst straddling the window edge", "[admission]") {
  AdmissionControl ac(small_config());
  const TimePoint t0 = Clock::now();
  CHECK(ac.check("c", "/x", t0).allowed);
  CHECK(ac.check("c", "/x", t0 + 59s).allowed);
  CHECK(ac.check("c", "/x", t0 + 59s).allowed);
  CHECK_FALSE(ac.check("c", "/x", t0 + 59s + 500ms).allowed);
  // The first stamp ages out exactly at the window boundary.
  const auto d = ac.check("c", "/x", t0 + 60s);
  CHECK(d.allowed);
  CHECK(d.info.remaining == 0);
  CHECK(d.info.reset_seconds == 59);
}

TEST_CASE("Clients and routes are tracked independently", "[admission]") {
  AdmissionControl ac(small_config());
  const TimePoint t0 = Clock::now();
  for (int i = 0; i < 3; ++i)
    CHECK(ac.check("a", "/x", t0).allowed);
  CHECK_FALSE(ac.check("a", "/x", t0).allowed);
  CHECK(ac.check("b", "/x", t0).allowed);
  CHECK(ac.check("a", "/y", t0).allowed);
  CHECK(ac.tracked_windows() == 3);
}

TEST_CASE("Longest route prefix picks the rule", "[admission][routes]") {
  AdmissionControl ac(small_config());
  CHECK(ac.rule_for("/api/upload/file").limit == 1);
  CHECK(ac.rule_for("/api/upload/bulk/7").limit == 5);
  CHECK(ac.rule_for("/api/other").limit == 3);

  const TimePoint t0 = Clock::now();
  CHECK(ac.check("c", "/api/upload/file", t0).allowed);
  const auto d = ac.check("c", "/api/upload/file", t0 + 4s);
  CHECK_FALSE(d.allowed);
  CHECK(d.info.reset_seconds == 6);
  CHECK(d.info.window_seconds == 10);

  const auto defaults = default_admission_config();
  AdmissionControl std_ac(defaults);
  CHECK(std_ac.rule_for("/api/chat/message").limit == 30);
  CHECK(std_ac.rule_for("/api/upload/x").limit == 10);
  CHECK(std_ac.rule_for("/api/training/run").limit == 60);
  CHECK(std_ac.rule_for("/health").limit == 60);
}

TEST_CASE("Enforce throws with the retry delay", "[admission]") {
  AdmissionConfig cfg;
  cfg.default_rule = {1, 30s};
  AdmissionControl ac(cfg);
  const auto info = ac.enforce("c", "/x");
  CHECK(info.remaining == 0);
  try {
    ac.enforce("c", "/x");
    FAIL("expected RateLimitExceeded");
  } catch (const RateLimitExceeded &e) {
    CHECK(e.limit() == 1);
    CHECK(e.reset_seconds() >= 29);
    CHECK(e.reset_seconds() <= 30);
  }
  CHECK(ac.info().find("admission_rejected:1") != std::string::npos);
  CHECK(ac.info().find("admission_allowed:1") != std::string::npos);
}

TEST_CASE("Sweep drops idle windows", "[admission][sweep]") {
  AdmissionControl ac(small_config());
  const TimePoint t0 = Clock::now();
  ac.check("a", "/x", t0);
  ac.check("b", "/api/upload/file", t0);
  ac.check("c", "/x", t0 + 30s);
  REQUIRE(ac.tracked_windows() == 3);

  // Upload windows are 10s wide, the default is 60s.
  CHECK(ac.sweep(t0 + 11s) == 1);
  CHECK(ac.sweep(t0 + 61s) == 1);
  CHECK(ac.tracked_windows() == 1);
  CHECK(ac.sweep(t0 + 91s) == 1);
  CHECK(ac.tracked_windows() == 0);
}

TEST_CASE("Idle windows are dropped without an explicit sweep",
          "[admission][sweep]") {
  AdmissionControl ac(small_config());
  const TimePoint t0 = Clock::now();
  for (int i = 0; i < 10000; ++i)
    ac.check("client-" + std::to_string(i), "/x", t0);
  CHECK(ac.tracked_windows() == 10000);

  CHECK(ac.check("late", "/x", t0 + 2h).allowed);
  CHECK(ac.tracked_windows() == 1);
}

TEST_CASE("Rejections never open a window", "[admission][sweep]") {
  AdmissionConfig cfg;
  cfg.default_rule = {0, 60s};
  AdmissionControl ac(cfg);
  const auto d = ac.check("c", "/closed", Clock::now());
  CHECK_FALSE(d.allowed);
  CHECK(d.info.reset_seconds == 60);
  CHECK(ac.tracked_windows() == 0);
}

TEST_CASE("Client identity and headers", "[admission][identity]") {
  const auto a = AdmissionControl::client_identity("10.0.0.1", "curl/8.0");
  CHECK(a == AdmissionControl::client_identity("10.0.0.1", "curl/8.0"));
  CHECK(a.rfind("10.0.0.1:", 0) == 0);
  CHECK(AdmissionControl::client_identity("", "x").rfind("127.0.0.1:", 0) ==
        0);

  const std::string long_ua(150, 'u');
  CHECK(AdmissionControl::client_identity("h", long_ua) ==
        AdmissionControl::client_identity("h", long_ua.substr(0, 100)));

  RateInfo info{30, 12, 45, 60};
  const auto h = AdmissionControl::headers(info);
  REQUIRE(h.size() == 3);
  CHECK(h[0].first == "X-RateLimit-Limit");
  CHECK(h[0].second == "30");
  CHECK(h[1].second == "12");
  CHECK(h[2].first == "X-RateLimit-Reset");
  CHECK(h[2].second == "45");
}
