#include "failsafe/types.hpp"

#include <sstream>

namespace failsafe {

std::uint64_t fnv1a(const std::string &s) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : s) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

std::string fnv1a_hex(const std::string &s) {
  std::ostringstream os;
  os << std::hex << fnv1a(s);
  return os.str();
}

} // namespace failsafe
