#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tagcache {

enum class RespType { Simple, Error, Integer, Bulk, Null, Array };

struct RespReply {
  RespType type{RespType::Null};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;
};

// Incremental RESP2 reply parser. Once malformed() is true the stream is
// unusable and the connection it came from must be dropped.
class RespReplyParser {
public:
  void feed(const char *data, std::size_t n);
  std::optional<RespReply> next_reply();
  bool malformed() const { return malformed_; }

private:
  enum class State { Complete, Incomplete, Malformed };
  State parse_at(std::size_t &pos, RespReply &out, int depth) const;
  std::string buffer_;
  bool malformed_{false};
};

// Encodes a request as an array of bulk strings.
std::string resp_command(const std::vector<std::string> &args);

} // namespace tagcache
