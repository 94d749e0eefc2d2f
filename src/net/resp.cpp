#include "tagcache/resp.hpp"

#include <charconv>
#include <string>

namespace tagcache {
namespace {
constexpr long long kMaxBulkLen = 512LL * 1024 * 1024;
constexpr long long kMaxArrayLen = 1024 * 1024;
constexpr int kMaxDepth = 8;

bool parse_ll(const std::string &s, std::size_t begin, std::size_t end,
              long long &out) {
  if (begin >= end)
    return false;
  const char *first = s.data() + begin;
  const char *last = s.data() + end;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
} // namespace

void RespReplyParser::feed(const char *data, std::size_t n) {
  if (!malformed_)
    buffer_.append(data, n);
}

std::optional<RespReply> RespReplyParser::next_reply() {
  if (malformed_ || buffer_.empty())
    return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  switch (parse_at(pos, reply, 0)) {
  case State::Complete:
    buffer_.erase(0, pos);
    return reply;
  case State::Incomplete:
    return std::nullopt;
  case State::Malformed:
    malformed_ = true;
    buffer_.clear();
    return std::nullopt;
  }
  return std::nullopt;
}

RespReplyParser::State RespReplyParser::parse_at(std::size_t &pos,
                                                 RespReply &out,
                                                 int depth) const {
  if (depth > kMaxDepth)
    return State::Malformed;
  if (pos >= buffer_.size())
    return State::Incomplete;
  const auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return State::Incomplete;
  const char marker = buffer_[pos];
  const std::size_t next = crlf + 2;

  switch (marker) {
  case '+':
  case '-':
    out.type = marker == '+' ? RespType::Simple : RespType::Error;
    out.str = buffer_.substr(pos + 1, crlf - pos - 1);
    pos = next;
    return State::Complete;
  case ':':
    if (!parse_ll(buffer_, pos + 1, crlf, out.integer))
      return State::Malformed;
    out.type = RespType::Integer;
    pos = next;
    return State::Complete;
  case '$': {
    long long len = 0;
    if (!parse_ll(buffer_, pos + 1, crlf, len))
      return State::Malformed;
    if (len == -1) {
      out.type = RespType::Null;
      pos = next;
      return State::Complete;
    }
    if (len < 0 || len > kMaxBulkLen)
      return State::Malformed;
    const std::size_t data_end = next + static_cast<std::size_t>(len);
    if (data_end + 2 > buffer_.size())
      return State::Incomplete;
    if (buffer_.compare(data_end, 2, "\r\n") != 0)
      return State::Malformed;
    out.type = RespType::Bulk;
    out.str = buffer_.substr(next, static_cast<std::size_t>(len));
    pos = data_end + 2;
    return State::Complete;
  }
  case '*': {
    long long n = 0;
    if (!parse_ll(buffer_, pos + 1, crlf, n))
      return State::Malformed;
    if (n == -1) {
      out.type = RespType::Null;
      pos = next;
      return State::Complete;
    }
    if (n < 0 || n > kMaxArrayLen)
      return State::Malformed;
    std::size_t cursor = next;
    std::vector<RespReply> elements;
    elements.reserve(static_cast<std::size_t>(n));
    for (long long i = 0; i < n; ++i) {
      RespReply child;
      const auto st = parse_at(cursor, child, depth + 1);
      if (st != State::Complete)
        return st;
      elements.push_back(std::move(child));
    }
    out.type = RespType::Array;
    out.elements = std::move(elements);
    pos = cursor;
    return State::Complete;
  }
  default:
    return State::Malformed;
  }
}

std::string resp_command(const std::vector<std::string> &args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto &a : args) {
    out += '$';
    out += std::to_string(a.size());
    out += "\r\n";
    out += a;
    out += "\r\n";
  }
  return out;
}

} // namespace tagcache
