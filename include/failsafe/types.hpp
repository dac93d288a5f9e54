#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace failsafe {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// Cached and computed payloads are opaque text (model responses, serialized
// lookups).
using Value = std::string;

std::uint64_t fnv1a(const std::string &s);
std::string fnv1a_hex(const std::string &s);

} // namespace failsafe
