#pragma once

#include "failsafe/circuit_breaker.hpp"
#include "failsafe/types.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace failsafe {

enum class Provider { Google, OpenAI, Anthropic, Local };

const char *to_string(Provider provider);
std::optional<Provider> provider_from_string(const std::string &name);

struct ModelConfig {
  std::string name;
  int tier{1};
  Provider provider{Provider::Local};
  std::string model_id;
  std::uint32_t max_tokens{4096};
  double temperature{0.7};
  Millis timeout{std::chrono::seconds(30)};
  // Estimated cost per 1000 tokens.
  double cost_per_unit{0.0};
  std::set<std::string> capabilities;

  bool supports(const std::string &capability) const {
    return capabilities.count(capability) != 0;
  }
};

std::vector<ModelConfig> default_models();

struct CompletionRequest {
  std::string prompt;
  std::optional<std::uint32_t> max_tokens;
  std::optional<double> temperature;
};

struct CallOptions {
  std::uint32_t max_tokens{0};
  double temperature{0.0};
  Millis timeout{0};
  // Requested when the attempt times out or the caller cancels.
  std::stop_token stop;
};

class IProviderHandler {
public:
  virtual ~IProviderHandler() = default;
  virtual std::string complete(const std::string &model_id,
                               const CompletionRequest &request,
                               const CallOptions &options) = 0;
};

struct RouterResult {
  std::string response;
  ModelConfig model;
  std::vector<std::string> attempted;
};

struct ModelUsage {
  std::uint64_t calls{0};
  std::uint64_t tokens_in{0};
  std::uint64_t tokens_out{0};
  double estimated_cost{0.0};
};

struct UsageReport {
  std::map<std::string, ModelUsage> models;
  std::optional<std::string> current_model;
  double total_cost{0.0};
};

struct ModelHealth {
  int tier{0};
  Provider provider{Provider::Local};
  CircuitState circuit_state{CircuitState::Closed};
  bool available{true};
};

// Tries models in ascending tier order, each through its own breaker and
// under its own timeout, and returns the first success.
class ModelRouter {
public:
  // max_abandoned_attempts bounds the timed-out or cancelled handler calls
  // still running; past it, new attempts fail without starting a thread.
  ModelRouter(std::vector<ModelConfig> models, CircuitRegistry &registry,
              std::size_t max_abandoned_attempts = 32);
  // Requests stop on every outstanding attempt and joins it.
  ~ModelRouter();

  ModelRouter(const ModelRouter &) = delete;
  ModelRouter &operator=(const ModelRouter &) = delete;

  void register_handler(Provider provider,
                        std::shared_ptr<IProviderHandler> handler);

  std::vector<ModelConfig>
  available_models(const std::optional<std::string> &capability = {}) const;

  // Throws FallbackExhausted when no candidate succeeds and
  // OperationCancelled when stop is requested.
  RouterResult
  call_with_fallback(const CompletionRequest &request,
                     const std::optional<std::string> &capability = {},
                     std::stop_token stop = {});

  std::optional<ModelConfig> current_model() const;
  UsageReport usage() const;
  std::map<std::string, ModelHealth> health() const;
  const std::vector<ModelConfig> &models() const { return models_; }
  std::string info() const;
  std::size_t abandoned_attempts() const;

  static std::string breaker_name(const ModelConfig &model);

private:
  struct AttemptState {
    std::promise<std::string> promise;
    std::atomic<bool> done{false};
    std::atomic<bool> abandoned{false};
  };
  struct Worker {
    std::jthread thread;
    std::shared_ptr<AttemptState> state;
  };

  std::shared_ptr<IProviderHandler> handler_for(Provider provider) const;
  std::string attempt(const ModelConfig &model,
                      const std::shared_ptr<IProviderHandler> &handler,
                      const CompletionRequest &request, std::stop_token stop);
  std::string run_with_timeout(const ModelConfig &model,
                               const std::shared_ptr<IProviderHandler> &handler,
                               const CompletionRequest &request,
                               std::stop_token stop);
  void record_usage(const ModelConfig &model, const CompletionRequest &request,
                    const std::string &response);
  std::size_t reap_workers_locked();

  std::vector<ModelConfig> models_;
  CircuitRegistry &registry_;
  mutable std::mutex mu_;
  std::unordered_map<Provider, std::shared_ptr<IProviderHandler>> handlers_;
  std::map<std::string, ModelUsage> usage_;
  std::optional<std::string> current_;
  const std::size_t max_abandoned_;
  mutable std::mutex workers_mu_;
  std::list<Worker> workers_;
};

} // namespace failsafe
