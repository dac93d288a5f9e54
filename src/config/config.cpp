#include "failsafe/config.hpp"

#include "failsafe/log.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace failsafe {
namespace {
// Raised by the extractors for a number that matched but does not fit its
// type; parse_config turns it into an error string.
class InvalidNumber : public std::runtime_error {
public:
  explicit InvalidNumber(const std::string &key)
      : std::runtime_error("invalid number for " + key) {}
};

template <typename T>
T parse_number(const std::string &digits, const std::string &key) {
  T value{};
  const char *end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (ec != std::errc() || ptr != end)
    throw InvalidNumber(key);
  return value;
}

bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?(?:[eE][-+]?[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = parse_number<double>(m[1].str(), key);
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = parse_number<std::uint64_t>(m[1].str(), key);
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
std::vector<std::string> extract_string_list(const std::string &text,
                                             const std::string &key) {
  std::vector<std::string> out;
  std::regex re("\"" + key + "\"\\s*:\\s*\\[([^\\]]*)\\]");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return out;
  const std::string body = m[1].str();
  std::regex item("\"([^\"]*)\"");
  for (auto it = std::sregex_iterator(body.begin(), body.end(), item);
       it != std::sregex_iterator(); ++it)
    out.push_back((*it)[1].str());
  return out;
}

// Returns the bracketed body that follows "key": with balanced nesting.
std::optional<std::string> section(const std::string &text,
                                   const std::string &key, char open,
                                   char close) {
  std::regex re("\"" + key + "\"\\s*:\\s*\\" + std::string(1, open));
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return std::nullopt;
  const std::size_t start =
      static_cast<std::size_t>(m.position(0) + m.length(0));
  int depth = 1;
  bool in_string = false;
  for (std::size_t i = start; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"' && (i == 0 || text[i - 1] != '\\'))
      in_string = !in_string;
    if (in_string)
      continue;
    if (c == open)
      ++depth;
    else if (c == close && --depth == 0)
      return text.substr(start, i - start);
  }
  return std::nullopt;
}

double clamp_d(double v, double lo, double hi) {
  return std::min(hi, std::max(lo, v));
}

std::uint64_t clamp_u(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}

Millis seconds_to_millis(double seconds) {
  return Millis(static_cast<Millis::rep>(seconds * 1000.0));
}

void apply_breaker(const std::string &body, BreakerConfig &b) {
  std::uint64_t u;
  double d;
  if (extract_u64(body, "failure_threshold", u))
    b.failure_threshold = static_cast<std::uint32_t>(clamp_u(u, 1, 1000000));
  if (extract_u64(body, "success_threshold", u))
    b.success_threshold = static_cast<std::uint32_t>(clamp_u(u, 1, 1000000));
  if (extract_u64(body, "half_open_max_calls", u))
    b.half_open_max_calls =
        static_cast<std::uint32_t>(clamp_u(u, 1, 1000000));
  if (extract_double(body, "timeout_seconds", d))
    b.timeout = seconds_to_millis(clamp_d(d, 0.0, 86400.0));
}

void apply_rule(const std::string &body, RateRule &r) {
  std::uint64_t u;
  if (extract_u64(body, "limit", u))
    r.limit = clamp_u(u, 0, 1000000000ULL);
  if (extract_u64(body, "window_seconds", u))
    r.window = std::chrono::seconds(clamp_u(u, 1, 86400));
}

bool parse_model(const std::string &body, ModelConfig &m, std::string *err) {
  std::string provider;
  if (!extract_string(body, "name", m.name) || m.name.empty() ||
      !extract_string(body, "provider", provider) ||
      !extract_string(body, "model_id", m.model_id)) {
    if (err)
      *err = "model entry missing name, provider or model_id";
    return false;
  }
  auto p = provider_from_string(provider);
  if (!p) {
    if (err)
      *err = "unknown provider '" + provider + "' for model " + m.name;
    return false;
  }
  m.provider = *p;
  std::uint64_t u;
  double d;
  if (extract_u64(body, "tier", u))
    m.tier = static_cast<int>(clamp_u(u, 0, 1000));
  if (extract_u64(body, "max_tokens", u))
    m.max_tokens = static_cast<std::uint32_t>(clamp_u(u, 1, 10000000));
  if (extract_double(body, "temperature", d))
    m.temperature = clamp_d(d, 0.0, 2.0);
  if (extract_double(body, "timeout_seconds", d))
    m.timeout = seconds_to_millis(clamp_d(d, 0.001, 600.0));
  if (extract_double(body, "cost_per_unit", d))
    m.cost_per_unit = clamp_d(d, 0.0, 1000.0);
  const auto caps = extract_string_list(body, "capabilities");
  m.capabilities = std::set<std::string>(caps.begin(), caps.end());
  return true;
}
} // namespace

Config default_config() {
  Config cfg;
  cfg.models = default_models();
  cfg.admission = default_admission_config();
  return cfg;
}

namespace {
bool parse_document(const std::string &text, Config &out, std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  Config cfg = out;
  std::uint64_t u;
  double d;
  bool b;
  std::string s;

  if (auto body = section(text, "cache", '{', '}')) {
    if (extract_u64(*body, "max_size", u))
      cfg.cache.max_size = static_cast<std::size_t>(clamp_u(u, 1, 10000000));
    if (extract_double(*body, "ttl_seconds", d))
      cfg.cache.default_ttl = seconds_to_millis(clamp_d(d, 0.0, 2592000.0));
    if (extract_u64(*body, "max_key_len", u))
      cfg.cache.max_key_len = static_cast<std::size_t>(clamp_u(u, 1, 65536));
  }

  if (auto body = section(text, "fetch", '{', '}')) {
    if (extract_bool(*body, "skip_empty", b))
      cfg.fetch.skip_empty = b;
    if (extract_string(*body, "prefix", s))
      cfg.fetch.prefix = s;
  }

  if (auto body = section(text, "breaker", '{', '}'))
    apply_breaker(*body, cfg.breaker);
  if (auto body = section(text, "model_breaker", '{', '}'))
    apply_breaker(*body, cfg.model_breaker);
  if (auto body = section(text, "breakers", '{', '}')) {
    std::regex entry("\"([^\"]+)\"\\s*:\\s*\\{([^{}]*)\\}");
    for (auto it = std::sregex_iterator(body->begin(), body->end(), entry);
         it != std::sregex_iterator(); ++it) {
      BreakerConfig bc = cfg.breaker;
      apply_breaker((*it)[2].str(), bc);
      cfg.breaker_overrides[(*it)[1].str()] = bc;
    }
  }

  if (auto body = section(text, "models", '[', ']')) {
    std::vector<ModelConfig> models;
    std::regex object("\\{([^{}]*)\\}");
    for (auto it = std::sregex_iterator(body->begin(), body->end(), object);
         it != std::sregex_iterator(); ++it) {
      ModelConfig m;
      if (!parse_model((*it)[1].str(), m, err))
        return false;
      models.push_back(std::move(m));
    }
    if (models.empty()) {
      if (err)
        *err = "models list is empty";
      return false;
    }
    cfg.models = std::move(models);
  }

  if (auto body = section(text, "admission", '{', '}')) {
    if (auto def = section(*body, "default", '{', '}'))
      apply_rule(*def, cfg.admission.default_rule);
    if (auto routes = section(*body, "routes", '{', '}')) {
      std::regex entry("\"([^\"]+)\"\\s*:\\s*\\{([^{}]*)\\}");
      for (auto it =
               std::sregex_iterator(routes->begin(), routes->end(), entry);
           it != std::sregex_iterator(); ++it) {
        RateRule r = cfg.admission.default_rule;
        apply_rule((*it)[2].str(), r);
        cfg.admission.routes[(*it)[1].str()] = r;
      }
    }
  }

  out = std::move(cfg);
  return true;
}
} // namespace

bool parse_config(const std::string &text, Config &out, std::string *err) {
  try {
    return parse_document(text, out, err);
  } catch (const InvalidNumber &e) {
    if (err)
      *err = e.what();
    return false;
  }
}

bool load_config(const std::string &path, Config &out, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  std::string parse_err;
  if (!parse_config(ss.str(), out, &parse_err)) {
    log(LogLevel::Warn, "config", path + ": " + parse_err);
    if (err)
      *err = parse_err;
    return false;
  }
  return true;
}

} // namespace failsafe
