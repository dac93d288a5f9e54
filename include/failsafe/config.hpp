#pragma once

#include "failsafe/admission_control.hpp"
#include "failsafe/circuit_breaker.hpp"
#include "failsafe/expiring_cache.hpp"
#include "failsafe/fetch_manager.hpp"
#include "failsafe/model_router.hpp"

#include <map>
#include <string>
#include <vector>

namespace failsafe {

struct Config {
  CacheConfig cache;
  FetchOptions fetch;
  BreakerConfig breaker;
  // Applied to the per-model breakers the router creates.
  BreakerConfig model_breaker{3, 3, std::chrono::seconds(60), 3};
  std::map<std::string, BreakerConfig> breaker_overrides;
  std::vector<ModelConfig> models;
  AdmissionConfig admission;
};

Config default_config();

// Reads a JSON document. Fields that are present replace the corresponding
// values in out after clamping; out is left untouched on error.
bool load_config(const std::string &path, Config &out,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, Config &out,
                  std::string *err = nullptr);

} // namespace failsafe
