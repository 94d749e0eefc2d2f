#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tagcache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;
using TagSet = std::set<std::string>;

enum class ErrorCode { None, InvalidArgument, Unavailable, Timeout, Upstream };

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;

  explicit operator bool() const { return code != ErrorCode::None; }
};

const char *to_string(ErrorCode code);

// Fills *err when err is non-null. Always returns false so callers can
// `return fail(err, ...)`.
bool fail(Error *err, ErrorCode code, std::string message);

inline Bytes to_bytes(const std::string &s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace tagcache
