#include "failsafe/errors.hpp"

#include <utility>

namespace failsafe {

CircuitOpenError::CircuitOpenError(std::string breaker)
    : Error("circuit '" + breaker + "' is open"), breaker_(std::move(breaker)) {
}

HandlerFailure::HandlerFailure(std::string candidate, std::string reason,
                               bool timed_out)
    : Error(candidate + ": " + reason), candidate_(std::move(candidate)),
      reason_(std::move(reason)), timed_out_(timed_out) {}

namespace {
std::string exhausted_message(const std::vector<std::string> &attempted,
                              const std::string &last_error) {
  std::string msg = "all candidates exhausted (attempted:";
  if (attempted.empty())
    msg += " none";
  for (std::size_t i = 0; i < attempted.size(); ++i)
    msg += (i == 0 ? " " : ", ") + attempted[i];
  msg += ")";
  if (!last_error.empty())
    msg += "; last error: " + last_error;
  return msg;
}
} // namespace

FallbackExhausted::FallbackExhausted(std::vector<std::string> attempted,
                                     std::string last_error)
    : Error(exhausted_message(attempted, last_error)),
      attempted_(std::move(attempted)), last_error_(std::move(last_error)) {}

RateLimitExceeded::RateLimitExceeded(std::uint64_t limit,
                                     std::uint64_t reset_seconds)
    : Error("rate limit of " + std::to_string(limit) +
            " exceeded, retry in " + std::to_string(reset_seconds) + "s"),
      limit_(limit), reset_seconds_(reset_seconds) {}

} // namespace failsafe
