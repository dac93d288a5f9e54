#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace failsafe {

class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// A breaker refused the call; the handler was never invoked.
class CircuitOpenError : public Error {
public:
  explicit CircuitOpenError(std::string breaker);
  const std::string &breaker() const { return breaker_; }

private:
  std::string breaker_;
};

class HandlerFailure : public Error {
public:
  HandlerFailure(std::string candidate, std::string reason,
                 bool timed_out = false);
  const std::string &candidate() const { return candidate_; }
  const std::string &reason() const { return reason_; }
  bool timed_out() const { return timed_out_; }

private:
  std::string candidate_;
  std::string reason_;
  bool timed_out_;
};

class FallbackExhausted : public Error {
public:
  FallbackExhausted(std::vector<std::string> attempted, std::string last_error);
  const std::vector<std::string> &attempted() const { return attempted_; }
  const std::string &last_error() const { return last_error_; }

private:
  std::vector<std::string> attempted_;
  std::string last_error_;
};

class RateLimitExceeded : public Error {
public:
  RateLimitExceeded(std::uint64_t limit, std::uint64_t reset_seconds);
  std::uint64_t limit() const { return limit_; }
  std::uint64_t reset_seconds() const { return reset_seconds_; }

private:
  std::uint64_t limit_;
  std::uint64_t reset_seconds_;
};

class OperationCancelled : public Error {
public:
  OperationCancelled() : Error("operation cancelled") {}
};

} // namespace failsafe
