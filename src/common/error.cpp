#include "tagcache/types.hpp"

#include <utility>

namespace tagcache {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Unavailable:
    return "unavailable";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Upstream:
    return "upstream";
  }
  return "unknown";
}

bool fail(Error *err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
  return false;
}

} // namespace tagcache
