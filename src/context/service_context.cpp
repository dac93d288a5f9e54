#include "failsafe/service_context.hpp"

#include "failsafe/log.hpp"

#include <iomanip>
#include <sstream>

namespace failsafe {
namespace {
CircuitRegistry &configure(CircuitRegistry &registry, const Config &cfg) {
  for (const auto &model : cfg.models)
    registry.set_config(ModelRouter::breaker_name(model), cfg.model_breaker);
  for (const auto &[name, bc] : cfg.breaker_overrides)
    registry.set_config(name, bc);
  return registry;
}
} // namespace

ServiceContext::ServiceContext(Config cfg)
    : cfg_(std::move(cfg)), cache_(cfg_.cache), fetcher_(cache_),
      breakers_(cfg_.breaker),
      router_(cfg_.models, configure(breakers_, cfg_)),
      admission_(cfg_.admission) {
  log(LogLevel::Info, "context",
      "initialized with " + std::to_string(cfg_.models.size()) +
          " models, cache max_size " + std::to_string(cache_.max_size()));
}

std::string ServiceContext::info() const {
  std::ostringstream os;
  os << cache_.info();
  os << fetcher_.info();
  os << breakers_.info();
  os << router_.info();
  os << admission_.info();
  return os.str();
}

std::string canonical_completion_key(const std::string &capability,
                                     const std::string &prompt,
                                     std::uint32_t max_tokens,
                                     std::optional<double> temperature) {
  std::ostringstream os;
  os << "rsp:" << (capability.empty() ? std::string("any") : capability) << ":"
     << fnv1a_hex(prompt) << ":" << max_tokens << ":";
  if (temperature)
    os << std::setprecision(17) << *temperature;
  else
    os << "default";
  return os.str();
}

CompletionPipeline::CompletionPipeline(ServiceContext &ctx)
    : CompletionPipeline(ctx, ctx.config().fetch) {}

CompletionPipeline::CompletionPipeline(ServiceContext &ctx, FetchOptions opts)
    : ctx_(ctx), opts_(std::move(opts)) {}

CompletionResult
CompletionPipeline::complete(const std::string &client_key,
                             const std::string &route,
                             const CompletionRequest &request,
                             const std::optional<std::string> &capability,
                             std::stop_token stop) {
  CompletionResult out;
  out.rate = ctx_.admission().enforce(client_key, route);

  const auto key = canonical_completion_key(
      capability.value_or(""), request.prompt, request.max_tokens.value_or(0),
      request.temperature);
  bool computed = false;
  auto value = ctx_.fetcher().get_or_fetch(
      key,
      [&]() -> std::optional<Value> {
        computed = true;
        return ctx_.router()
            .call_with_fallback(request, capability, stop)
            .response;
      },
      opts_);
  out.response = value.value_or(Value{});
  out.computed = computed;
  return out;
}

} // namespace failsafe
