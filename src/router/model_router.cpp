#include "failsafe/model_router.hpp"

#include "failsafe/errors.hpp"
#include "failsafe/log.hpp"

#include <algorithm>
#include <future>
#include <list>
#include <sstream>
#include <thread>

namespace failsafe {
namespace {
constexpr Millis kPollSlice{10};
constexpr std::size_t kCharsPerToken = 4;
} // namespace

const char *to_string(Provider provider) {
  switch (provider) {
  case Provider::Google:
    return "google";
  case Provider::OpenAI:
    return "openai";
  case Provider::Anthropic:
    return "anthropic";
  case Provider::Local:
    return "local";
  }
  return "unknown";
}

std::optional<Provider> provider_from_string(const std::string &name) {
  if (name == "google")
    return Provider::Google;
  if (name == "openai")
    return Provider::OpenAI;
  if (name == "anthropic")
    return Provider::Anthropic;
  if (name == "local" || name == "ollama")
    return Provider::Local;
  return std::nullopt;
}

std::vector<ModelConfig> default_models() {
  std::vector<ModelConfig> models(4);
  models[0].name = "gemini-pro";
  models[0].tier = 1;
  models[0].provider = Provider::Google;
  models[0].model_id = "gemini-1.5-pro";
  models[0].max_tokens = 8192;
  models[0].cost_per_unit = 0.00125;
  models[0].capabilities = {"chat", "code", "reasoning", "long_context"};

  models[1].name = "gemini-flash";
  models[1].tier = 2;
  models[1].provider = Provider::Google;
  models[1].model_id = "gemini-1.5-flash";
  models[1].max_tokens = 8192;
  models[1].cost_per_unit = 0.000075;
  models[1].capabilities = {"chat", "code", "fast"};

  models[2].name = "gpt-4o-mini";
  models[2].tier = 3;
  models[2].provider = Provider::OpenAI;
  models[2].model_id = "gpt-4o-mini";
  models[2].max_tokens = 4096;
  models[2].cost_per_unit = 0.00015;
  models[2].capabilities = {"chat", "code"};

  models[3].name = "local-ollama";
  models[3].tier = 4;
  models[3].provider = Provider::Local;
  models[3].model_id = "llama3:8b";
  models[3].max_tokens = 2048;
  models[3].cost_per_unit = 0.0;
  models[3].capabilities = {"chat"};
  return models;
}

ModelRouter::ModelRouter(std::vector<ModelConfig> models,
                         CircuitRegistry &registry,
                         std::size_t max_abandoned_attempts)
    : models_(std::move(models)), registry_(registry),
      max_abandoned_(std::max<std::size_t>(1, max_abandoned_attempts)) {
  std::stable_sort(models_.begin(), models_.end(),
                   [](const ModelConfig &a, const ModelConfig &b) {
                     return a.tier < b.tier;
                   });
}

ModelRouter::~ModelRouter() {
  std::list<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    workers.swap(workers_);
  }
  for (auto &w : workers)
    w.thread.request_stop();
  // Each jthread joins as the list goes out of scope.
}

std::string ModelRouter::breaker_name(const ModelConfig &model) {
  return "model:" + model.name;
}

void ModelRouter::register_handler(Provider provider,
                                   std::shared_ptr<IProviderHandler> handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handlers_[provider] = std::move(handler);
}

std::shared_ptr<IProviderHandler>
ModelRouter::handler_for(Provider provider) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = handlers_.find(provider);
  return it == handlers_.end() ? nullptr : it->second;
}

std::vector<ModelConfig> ModelRouter::available_models(
    const std::optional<std::string> &capability) const {
  std::vector<ModelConfig> out;
  for (const auto &model : models_) {
    if (capability && !model.supports(*capability))
      continue;
    if (!registry_.get_or_create(breaker_name(model))->available())
      continue;
    out.push_back(model);
  }
  return out;
}

RouterResult
ModelRouter::call_with_fallback(const CompletionRequest &request,
                                const std::optional<std::string> &capability,
                                std::stop_token stop) {
  const auto candidates = available_models(capability);
  std::vector<std::string> attempted;
  std::string last_error =
      candidates.empty() ? "no candidate models available" : "";

  for (const auto &model : candidates) {
    if (stop.stop_requested())
      throw OperationCancelled();
    attempted.push_back(model.name);

    auto handler = handler_for(model.provider);
    if (!handler) {
      last_error = HandlerFailure(model.name,
                                  std::string("no handler for provider ") +
                                      to_string(model.provider))
                       .what();
      log(LogLevel::Warn, "router", last_error);
      continue;
    }

    try {
      log(LogLevel::Debug, "router", "attempting model " + model.name);
      std::string response = attempt(model, handler, request, stop);
      record_usage(model, request, response);
      return {std::move(response), model, std::move(attempted)};
    } catch (const CircuitOpenError &e) {
      last_error = e.what();
      log(LogLevel::Warn, "router",
          "circuit open for " + model.name + ", trying next");
    } catch (const HandlerFailure &e) {
      last_error = e.what();
      log(LogLevel::Warn, "router",
          std::string(e.timed_out() ? "timeout: " : "failure: ") + e.what());
    }
  }

  log(LogLevel::Error, "router",
      "all models failed, last error: " + last_error);
  throw FallbackExhausted(std::move(attempted), std::move(last_error));
}

std::string
ModelRouter::attempt(const ModelConfig &model,
                     const std::shared_ptr<IProviderHandler> &handler,
                     const CompletionRequest &request, std::stop_token stop) {
  auto breaker = registry_.get_or_create(breaker_name(model));
  return breaker->call(
      [&] { return run_with_timeout(model, handler, request, stop); });
}

std::string
ModelRouter::run_with_timeout(const ModelConfig &model,
                              const std::shared_ptr<IProviderHandler> &handler,
                              const CompletionRequest &request,
                              std::stop_token stop) {
  auto state = std::make_shared<AttemptState>();
  auto future = state->promise.get_future();

  CallOptions opts;
  opts.max_tokens = request.max_tokens.value_or(model.max_tokens);
  opts.temperature = request.temperature.value_or(model.temperature);
  opts.timeout = model.timeout;

  std::stop_source worker_stop;
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    if (reap_workers_locked() >= max_abandoned_)
      throw HandlerFailure(model.name,
                           "too many abandoned attempts (" +
                               std::to_string(max_abandoned_) + ")");
    // The worker owns copies of everything it touches so an abandoned
    // attempt can finish after we return.
    try {
      std::jthread worker([state, handler, model_id = model.model_id, request,
                           opts](std::stop_token token) mutable {
        opts.stop = token;
        try {
          state->promise.set_value(handler->complete(model_id, request, opts));
        } catch (...) {
          state->promise.set_exception(std::current_exception());
        }
        state->done = true;
      });
      worker_stop = worker.get_stop_source();
      workers_.push_back({std::move(worker), state});
    } catch (const std::exception &e) {
      throw HandlerFailure(model.name,
                           std::string("cannot start attempt: ") + e.what());
    }
  }

  auto abandon = [&] {
    state->abandoned = true;
    worker_stop.request_stop();
  };

  const auto deadline = Clock::now() + model.timeout;
  while (true) {
    if (stop.stop_requested()) {
      abandon();
      throw OperationCancelled();
    }
    const auto now = Clock::now();
    if (now >= deadline) {
      abandon();
      throw HandlerFailure(model.name,
                           "timed out after " +
                               std::to_string(model.timeout.count()) + "ms",
                           true);
    }
    const auto slice = std::min<Clock::duration>(deadline - now, kPollSlice);
    if (future.wait_for(slice) == std::future_status::ready)
      break;
  }

  try {
    return future.get();
  } catch (const OperationCancelled &) {
    throw;
  } catch (const HandlerFailure &) {
    throw;
  } catch (const std::exception &e) {
    throw HandlerFailure(model.name, e.what());
  } catch (...) {
    throw HandlerFailure(model.name, "non-standard exception");
  }
}

// Joins workers that have returned and counts the abandoned ones still
// running.
std::size_t ModelRouter::reap_workers_locked() {
  std::size_t abandoned = 0;
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->state->done) {
      it = workers_.erase(it);
      continue;
    }
    if (it->state->abandoned)
      ++abandoned;
    ++it;
  }
  return abandoned;
}

std::size_t ModelRouter::abandoned_attempts() const {
  std::lock_guard<std::mutex> lock(workers_mu_);
  std::size_t n = 0;
  for (const auto &w : workers_)
    if (w.state->abandoned && !w.state->done)
      ++n;
  return n;
}

void ModelRouter::record_usage(const ModelConfig &model,
                               const CompletionRequest &request,
                               const std::string &response) {
  const auto tokens_in = request.prompt.size() / kCharsPerToken;
  const auto tokens_out = response.size() / kCharsPerToken;
  std::lock_guard<std::mutex> lock(mu_);
  auto &u = usage_[model.name];
  ++u.calls;
  u.tokens_in += tokens_in;
  u.tokens_out += tokens_out;
  u.estimated_cost += static_cast<double>(tokens_in + tokens_out) / 1000.0 *
                      model.cost_per_unit;
  current_ = model.name;
}

std::optional<ModelConfig> ModelRouter::current_model() const {
  std::optional<std::string> name;
  {
    std::lock_guard<std::mutex> lock(mu_);
    name = current_;
  }
  if (!name)
    return std::nullopt;
  for (const auto &m : models_)
    if (m.name == *name)
      return m;
  return std::nullopt;
}

UsageReport ModelRouter::usage() const {
  std::lock_guard<std::mutex> lock(mu_);
  UsageReport report;
  report.models = usage_;
  report.current_model = current_;
  for (const auto &[name, u] : usage_)
    report.total_cost += u.estimated_cost;
  return report;
}

std::map<std::string, ModelHealth> ModelRouter::health() const {
  std::map<std::string, ModelHealth> out;
  for (const auto &model : models_) {
    auto breaker = registry_.get_or_create(breaker_name(model));
    ModelHealth h;
    h.tier = model.tier;
    h.provider = model.provider;
    h.circuit_state = breaker->state();
    h.available = breaker->available();
    out[model.name] = h;
  }
  return out;
}

std::string ModelRouter::info() const {
  const auto report = usage();
  std::ostringstream os;
  os << "router_models:" << models_.size() << "\n";
  os << "router_current_model:" << report.current_model.value_or("none")
     << "\n";
  os << "router_total_cost:" << report.total_cost << "\n";
  for (const auto &[name, u] : report.models)
    os << "usage." << name << ":calls=" << u.calls
       << ",tokens_in=" << u.tokens_in << ",tokens_out=" << u.tokens_out
       << ",estimated_cost=" << u.estimated_cost << "\n";
  for (const auto &[name, h] : health())
    os << "health." << name << ":tier=" << h.tier
       << ",provider=" << to_string(h.provider)
       << ",circuit_state=" << to_string(h.circuit_state)
       << ",available=" << (h.available ? 1 : 0) << "\n";
  return os.str();
}

} // namespace failsafe
