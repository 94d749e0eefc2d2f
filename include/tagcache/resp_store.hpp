#pragma once

#include "tagcache/backing_store.hpp"
#include "tagcache/resp.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tagcache {

struct RespStoreConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::uint64_t connect_timeout_ms{500};
  // Prepended to every key sent to the server.
  std::string key_prefix;
  std::size_t scan_count{256};
};

struct RespStoreStats {
  std::uint64_t commands{0};
  std::uint64_t connects{0};
  std::uint64_t timeouts{0};
  std::uint64_t failures{0};
};

// Backing store over one RESP2 connection to a Redis-compatible server.
// Calls are serialized on the connection. A timeout or protocol error drops
// the connection; the next call reconnects.
class RespStore : public IBackingStore {
public:
  explicit RespStore(RespStoreConfig cfg);
  ~RespStore() override;
  RespStore(const RespStore &) = delete;
  RespStore &operator=(const RespStore &) = delete;

  std::string name() const override { return "resp"; }
  bool raw_get(const std::string &key, std::optional<Bytes> &out,
               std::chrono::milliseconds timeout,
               Error *err = nullptr) override;
  bool raw_set(const std::string &key, const Bytes &value,
               std::chrono::milliseconds ttl, std::chrono::milliseconds timeout,
               Error *err = nullptr) override;
  bool raw_del(const std::string &key, std::chrono::milliseconds timeout,
               Error *err = nullptr) override;
  bool raw_scan_prefix(const std::string &prefix, std::vector<std::string> &out,
                       std::chrono::milliseconds timeout,
                       Error *err = nullptr) override;

  bool ping(std::chrono::milliseconds timeout, Error *err = nullptr);
  bool connected() const;
  RespStoreStats stats() const;
  const RespStoreConfig &config() const { return cfg_; }

private:
  bool ensure_connected_locked(TimePoint deadline, Error *err);
  bool send_all_locked(const std::string &payload, TimePoint deadline,
                       Error *err);
  bool read_reply_locked(RespReply &out, TimePoint deadline, Error *err);
  bool call_locked(const std::vector<std::string> &args, RespReply &out,
                   TimePoint deadline, Error *err);
  bool call(const std::vector<std::string> &args, RespReply &out,
            std::chrono::milliseconds timeout, Error *err);
  void disconnect_locked();
  bool fail_locked(Error *err, ErrorCode code, std::string message);

  RespStoreConfig cfg_;
  mutable std::mutex mu_;
  int fd_{-1};
  RespReplyParser parser_;
  RespStoreStats stats_;
};

// Escapes glob metacharacters so a literal prefix can be used in MATCH.
std::string glob_escape(const std::string &s);

} // namespace tagcache
