#pragma once

#include "failsafe/admission_control.hpp"
#include "failsafe/circuit_breaker.hpp"
#include "failsafe/config.hpp"
#include "failsafe/expiring_cache.hpp"
#include "failsafe/fetch_manager.hpp"
#include "failsafe/model_router.hpp"

#include <optional>
#include <stop_token>
#include <string>

namespace failsafe {

// Owns one instance of every component for the life of the process.
class ServiceContext {
public:
  explicit ServiceContext(Config cfg);

  ServiceContext(const ServiceContext &) = delete;
  ServiceContext &operator=(const ServiceContext &) = delete;

  ExpiringCache &cache() { return cache_; }
  FetchManager &fetcher() { return fetcher_; }
  CircuitRegistry &breakers() { return breakers_; }
  ModelRouter &router() { return router_; }
  AdmissionControl &admission() { return admission_; }
  const Config &config() const { return cfg_; }

  std::string info() const;

private:
  Config cfg_;
  ExpiringCache cache_;
  FetchManager fetcher_;
  CircuitRegistry breakers_;
  ModelRouter router_;
  AdmissionControl admission_;
};

// Requests that differ in capability, prompt, max_tokens or temperature never
// share a cached response.
std::string canonical_completion_key(const std::string &capability,
                                     const std::string &prompt,
                                     std::uint32_t max_tokens,
                                     std::optional<double> temperature = {});

struct CompletionResult {
  std::string response;
  // False when the response came from the cache or from another caller's
  // in-flight computation.
  bool computed{false};
  RateInfo rate;
};

// admission -> coalesced cache fetch -> tiered router
class CompletionPipeline {
public:
  explicit CompletionPipeline(ServiceContext &ctx);
  CompletionPipeline(ServiceContext &ctx, FetchOptions opts);

  CompletionResult complete(const std::string &client_key,
                            const std::string &route,
                            const CompletionRequest &request,
                            const std::optional<std::string> &capability = {},
                            std::stop_token stop = {});

private:
  ServiceContext &ctx_;
  FetchOptions opts_;
};

} // namespace failsafe
