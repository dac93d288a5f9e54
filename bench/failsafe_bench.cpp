#include "failsafe/config.hpp"
#include "failsafe/errors.hpp"
#include "failsafe/log.hpp"
#include "failsafe/service_context.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace failsafe;

namespace {
struct WorkloadResult {
  std::string name;
  double ops_s{0};
  double p50{0};
  double p95{0};
  double p99{0};
  double p999{0};
  double ok_rate{0};
};

double pct(std::vector<double> v, double p) {
  if (v.empty())
    return 0.0;
  std::sort(v.begin(), v.end());
  std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(v.size() - 1));
  return v[idx];
}

// Simulated provider: fixed latency plus an optional failure ratio.
class SimProvider : public IProviderHandler {
public:
  SimProvider(std::chrono::microseconds latency, double failure_ratio)
      : latency_(latency), failure_ratio_(failure_ratio) {}

  std::string complete(const std::string &model_id,
                       const CompletionRequest &request,
                       const CallOptions &) override {
    std::this_thread::sleep_for(latency_);
    const auto n = counter_.fetch_add(1);
    if (failure_ratio_ > 0.0 &&
        static_cast<double>(n % 100) < failure_ratio_ * 100.0)
      throw std::runtime_error("simulated 503 from " + model_id);
    return model_id + " says " + std::to_string(request.prompt.size());
  }

private:
  std::chrono::microseconds latency_;
  double failure_ratio_;
  std::atomic<std::uint64_t> counter_{0};
};

using Op = std::function<bool(int, std::mt19937_64 &)>;

WorkloadResult run_workload(const std::string &name, int threads,
                            int ops_per_thread, const Op &fn) {
  std::vector<std::vector<double>> lat(static_cast<std::size_t>(threads));
  std::atomic<int> ok{0};
  auto t0 = std::chrono::steady_clock::now();
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937_64 rng(static_cast<std::uint64_t>(7 + t));
      auto &mine = lat[static_cast<std::size_t>(t)];
      for (int i = 0; i < ops_per_thread; ++i) {
        auto s = std::chrono::steady_clock::now();
        if (fn(i, rng))
          ++ok;
        mine.push_back(std::chrono::duration<double, std::micro>(
                           std::chrono::steady_clock::now() - s)
                           .count());
      }
    });
  }
  for (auto &w : workers)
    w.join();
  auto sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
  std::vector<double> all;
  for (const auto &l : lat)
    all.insert(all.end(), l.begin(), l.end());
  const int ops = threads * ops_per_thread;
  return {name, static_cast<double>(ops) / sec, pct(all, 0.50), pct(all, 0.95),
          pct(all, 0.99), pct(all, 0.999),
          static_cast<double>(ok.load()) / static_cast<double>(ops)};
}

} // namespace

int main(int argc, char **argv) {
  std::string out = "failsafe_bench_summary.json";
  Config cfg = default_config();
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      std::string err;
      if (!load_config(argv[++i], cfg, &err)) {
        std::cerr << "config error: " << err << "\n";
        return 1;
      }
    } else if (arg == "--out" && i + 1 < argc) {
      out = argv[++i];
    } else if (arg == "--quiet") {
      set_log_level(LogLevel::Error);
    }
  }

  ServiceContext ctx(cfg);
  // The first provider fails two calls in three to exercise the fallback path.
  ctx.router().register_handler(
      Provider::Google,
      std::make_shared<SimProvider>(std::chrono::microseconds(500), 0.66));
  ctx.router().register_handler(
      Provider::OpenAI,
      std::make_shared<SimProvider>(std::chrono::microseconds(800), 0.0));
  ctx.router().register_handler(
      Provider::Local,
      std::make_shared<SimProvider>(std::chrono::microseconds(2000), 0.0));
  CompletionPipeline pipeline(ctx);

  std::vector<WorkloadResult> results;
  results.push_back(run_workload(
      "hot_key_herd", 16, 200, [&](int i, std::mt19937_64 &) {
        CompletionRequest req{"hot prompt " + std::to_string(i % 8), {}, {}};
        try {
          pipeline.complete("herd", "/api/training/run", req);
          return true;
        } catch (const Error &) {
          return false;
        }
      }));

  results.push_back(run_workload(
      "flaky_primary_fallback", 8, 150, [&](int i, std::mt19937_64 &rng) {
        CompletionRequest req{"unique " + std::to_string(i) + ":" +
                                  std::to_string(rng()),
                              {}, {}};
        try {
          return !ctx.router().call_with_fallback(req).response.empty();
        } catch (const FallbackExhausted &) {
          return false;
        }
      }));

  results.push_back(run_workload(
      "rate_limit_storm", 8, 500, [&](int i, std::mt19937_64 &rng) {
        const auto client = AdmissionControl::client_identity(
            "10.0.0." + std::to_string(rng() % 4), "bench/1.0");
        return ctx.admission()
            .check(client, i % 2 ? "/api/upload/file" : "/api/chat/message")
            .allowed;
      }));

  std::ofstream os(out);
  os << "{\n  \"workloads\": [\n";
  for (std::size_t i = 0; i < results.size(); ++i) {
    const auto &r = results[i];
    os << "    {\"name\":\"" << r.name << "\",\"ops_s\":" << std::fixed << std::setprecision(2)
       << r.ops_s << ",\"p50_us\":" << r.p50 << ",\"p95_us\":" << r.p95
       << ",\"p99_us\":" << r.p99 << ",\"p999_us\":" << r.p999
       << ",\"ok_rate\":" << r.ok_rate << "}";
    if (i + 1 != results.size())
      os << ",";
    os << "\n";
  }
  os << "  ]\n}\n";

  std::cout << ctx.info();
  std::cout << "wrote " << out << "\n";
  return 0;
}
