#include "tagcache/resp_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace tagcache {
namespace {
int remaining_ms(TimePoint deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - Clock::now())
                        .count();
  if (left <= 0)
    return 0;
  return static_cast<int>(std::min<long long>(left, 60 * 60 * 1000));
}

bool set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string unexpected(const RespReply &r) {
  return "unexpected reply type " + std::to_string(static_cast<int>(r.type));
}
} // namespace

std::string glob_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

RespStore::RespStore(RespStoreConfig cfg) : cfg_(std::move(cfg)) {
  std::lock_guard lk(mu_);
  // A server that is down at startup is not fatal; calls retry the connect.
  Error ignored;
  const auto deadline =
      Clock::now() + std::chrono::milliseconds(cfg_.connect_timeout_ms);
  ensure_connected_locked(deadline, &ignored);
}

RespStore::~RespStore() {
  std::lock_guard lk(mu_);
  disconnect_locked();
}

bool RespStore::connected() const {
  std::lock_guard lk(mu_);
  return fd_ >= 0;
}

RespStoreStats RespStore::stats() const {
  std::lock_guard lk(mu_);
  return stats_;
}

bool RespStore::raw_get(const std::string &key, std::optional<Bytes> &out,
                        std::chrono::milliseconds timeout, Error *err) {
  out.reset();
  RespReply r;
  if (!call({"GET", cfg_.key_prefix + key}, r, timeout, err))
    return false;
  if (r.type == RespType::Null)
    return true;
  if (r.type != RespType::Bulk)
    return fail(err, ErrorCode::Unavailable, unexpected(r));
  out = to_bytes(r.str);
  return true;
}

bool RespStore::raw_set(const std::string &key, const Bytes &value,
                        std::chrono::milliseconds ttl,
                        std::chrono::milliseconds timeout, Error *err) {
  if (ttl.count() <= 0)
    return fail(err, ErrorCode::InvalidArgument, "ttl must be positive");
  RespReply r;
  if (!call({"SET", cfg_.key_prefix + key, to_string(value), "PX",
             std::to_string(ttl.count())},
            r, timeout, err))
    return false;
  if (r.type != RespType::Simple || r.str != "OK")
    return fail(err, ErrorCode::Unavailable, unexpected(r));
  return true;
}

bool RespStore::raw_del(const std::string &key,
                        std::chrono::milliseconds timeout, Error *err) {
  RespReply r;
  if (!call({"DEL", cfg_.key_prefix + key}, r, timeout, err))
    return false;
  if (r.type != RespType::Integer)
    return fail(err, ErrorCode::Unavailable, unexpected(r));
  return true;
}

bool RespStore::raw_scan_prefix(const std::string &prefix,
                                std::vector<std::string> &out,
                                std::chrono::milliseconds timeout, Error *err) {
  std::lock_guard lk(mu_);
  const auto deadline = Clock::now() + timeout;
  const auto pattern = glob_escape(cfg_.key_prefix + prefix) + "*";
  out.clear();
  std::string cursor = "0";
  do {
    RespReply r;
    if (!call_locked({"SCAN", cursor, "MATCH", pattern, "COUNT",
                      std::to_string(cfg_.scan_count)},
                     r, deadline, err))
      return false;
    if (r.type != RespType::Array || r.elements.size() != 2 ||
        r.elements[0].type != RespType::Bulk ||
        r.elements[1].type != RespType::Array)
      return fail(err, ErrorCode::Unavailable, "malformed SCAN reply");
    cursor = r.elements[0].str;
    for (const auto &k : r.elements[1].elements) {
      if (k.type == RespType::Bulk)
        out.push_back(k.str.substr(cfg_.key_prefix.size()));
    }
  } while (cursor != "0");
  // SCAN may report a key more than once.
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return true;
}

bool RespStore::ping(std::chrono::milliseconds timeout, Error *err) {
  RespReply r;
  if (!call({"PING"}, r, timeout, err))
    return false;
  if (r.type != RespType::Simple || r.str != "PONG")
    return fail(err, ErrorCode::Unavailable, unexpected(r));
  return true;
}

bool RespStore::call(const std::vector<std::string> &args, RespReply &out,
                     std::chrono::milliseconds timeout, Error *err) {
  std::lock_guard lk(mu_);
  return call_locked(args, out, Clock::now() + timeout, err);
}

bool RespStore::call_locked(const std::vector<std::string> &args,
                            RespReply &out, TimePoint deadline, Error *err) {
  if (!ensure_connected_locked(deadline, err))
    return false;
  ++stats_.commands;
  if (!send_all_locked(resp_command(args), deadline, err))
    return false;
  if (!read_reply_locked(out, deadline, err))
    return false;
  if (out.type == RespType::Error) {
    // The stream is still in sync after an error reply; keep the connection.
    ++stats_.failures;
    return fail(err, ErrorCode::Unavailable, "server error: " + out.str);
  }
  return true;
}

bool RespStore::ensure_connected_locked(TimePoint deadline, Error *err) {
  if (fd_ >= 0)
    return true;
  const auto connect_deadline = std::min(
      deadline,
      Clock::now() + std::chrono::milliseconds(cfg_.connect_timeout_ms));

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const auto port = std::to_string(cfg_.port);
  const int rc = getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0)
    return fail_locked(err, ErrorCode::Unavailable,
                       std::string("resolve failed: ") + gai_strerror(rc));

  bool timed_out = false;
  std::string last_error = "no address";
  for (addrinfo *p = res; p != nullptr && fd_ < 0; p = p->ai_next) {
    int fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    if (!set_nonblocking(fd)) {
      last_error = std::strerror(errno);
      close(fd);
      continue;
    }
    if (connect(fd, p->ai_addr, p->ai_addrlen) != 0) {
      if (errno != EINPROGRESS) {
        last_error = std::strerror(errno);
        close(fd);
        continue;
      }
      pollfd pfd{fd, POLLOUT, 0};
      const int n = poll(&pfd, 1, remaining_ms(connect_deadline));
      if (n == 0) {
        timed_out = true;
        last_error = "connect timed out";
        close(fd);
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (n < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
          so_error != 0) {
        last_error = std::strerror(n < 0 ? errno : so_error);
        close(fd);
        continue;
      }
    }
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fd_ = fd;
  }
  freeaddrinfo(res);

  if (fd_ < 0)
    return fail_locked(err,
                       timed_out ? ErrorCode::Timeout : ErrorCode::Unavailable,
                       "connect to " + cfg_.host + ":" + port + " failed: " +
                           last_error);
  parser_ = RespReplyParser{};
  ++stats_.connects;
  return true;
}

bool RespStore::send_all_locked(const std::string &payload, TimePoint deadline,
                                Error *err) {
  std::size_t sent = 0;
  while (sent < payload.size()) {
    const ssize_t n =
        send(fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      const int ready = poll(&pfd, 1, remaining_ms(deadline));
      if (ready == 0)
        return fail_locked(err, ErrorCode::Timeout, "send timed out");
      if (ready < 0 && errno != EINTR)
        return fail_locked(err, ErrorCode::Unavailable,
                           std::string("poll failed: ") + std::strerror(errno));
      continue;
    }
    return fail_locked(err, ErrorCode::Unavailable,
                       std::string("send failed: ") + std::strerror(errno));
  }
  return true;
}

bool RespStore::read_reply_locked(RespReply &out, TimePoint deadline,
                                  Error *err) {
  char buf[16 * 1024];
  while (true) {
    if (auto reply = parser_.next_reply()) {
      out = std::move(*reply);
      return true;
    }
    if (parser_.malformed())
      return fail_locked(err, ErrorCode::Unavailable, "malformed reply");
    pollfd pfd{fd_, POLLIN, 0};
    const int ready = poll(&pfd, 1, remaining_ms(deadline));
    if (ready == 0)
      return fail_locked(err, ErrorCode::Timeout, "reply timed out");
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      return fail_locked(err, ErrorCode::Unavailable,
                         std::string("poll failed: ") + std::strerror(errno));
    }
    const ssize_t n = recv(fd_, buf, sizeof(buf), 0);
    if (n == 0)
      return fail_locked(err, ErrorCode::Unavailable, "connection closed");
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue;
      return fail_locked(err, ErrorCode::Unavailable,
                         std::string("recv failed: ") + std::strerror(errno));
    }
    parser_.feed(buf, static_cast<std::size_t>(n));
  }
}

void RespStore::disconnect_locked() {
  if (fd_ >= 0) {
    close(fd_);
    fd_ = -1;
  }
  parser_ = RespReplyParser{};
}

bool RespStore::fail_locked(Error *err, ErrorCode code, std::string message) {
  disconnect_locked();
  if (code == ErrorCode::Timeout)
    ++stats_.timeouts;
  else
    ++stats_.failures;
  return fail(err, code, std::move(message));
}

} // namespace tagcache
