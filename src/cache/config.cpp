#include "tagcache/config.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

namespace tagcache {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  const auto digits = m[1].str();
  const auto res =
      std::from_chars(digits.data(), digits.data() + digits.size(), out);
  // Out-of-range values saturate; the caller clamps them.
  if (res.ec == std::errc::result_out_of_range)
    out = std::numeric_limits<std::uint64_t>::max();
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
std::uint64_t clamp_u64(std::uint64_t v, std::uint64_t lo, std::uint64_t hi) {
  return std::clamp(v, lo, hi);
}
} // namespace

bool parse_config(const std::string &text, CacheConfig &cfg,
                  std::string *err) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos ||
      close < open) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig c = cfg;
  std::uint64_t u;
  std::string s;
  bool b;
  if (extract_string(text, "store", s)) {
    if (s != "memory" && s != "resp") {
      if (err)
        *err = "unknown store: " + s;
      return false;
    }
    c.store = s;
  }

  if (extract_u64(text, "max_key_len", u))
    c.cache.max_key_len = clamp_u64(u, 1, 64 * 1024);
  if (extract_u64(text, "max_value_size", u))
    c.cache.max_value_size = clamp_u64(u, 1, 512ULL * 1024 * 1024);
  if (extract_string(text, "namespace_separator", s)) {
    if (s.size() != 1) {
      if (err)
        *err = "namespace_separator must be one character";
      return false;
    }
    c.cache.namespace_separator = s[0];
  }
  if (extract_u64(text, "op_timeout_ms", u))
    c.cache.op_timeout_ms = clamp_u64(u, 1, 60 * 1000);
  if (extract_u64(text, "expiry_cleanup_per_tick", u))
    c.cache.expiry_cleanup_per_tick = clamp_u64(u, 1, 1000000);
  if (extract_u64(text, "lock_stripes", u))
    c.cache.lock_stripes = clamp_u64(u, 1, 4096);
  if (extract_bool(text, "log_events", b))
    c.cache.log_events = b;

  if (extract_u64(text, "memory_ttl_cleanup_per_tick", u))
    c.memory.ttl_cleanup_per_tick = clamp_u64(u, 1, 1000000);

  if (extract_string(text, "resp_host", s))
    c.resp.host = s;
  if (extract_u64(text, "resp_port", u))
    c.resp.port = static_cast<int>(clamp_u64(u, 1, 65535));
  if (extract_u64(text, "resp_connect_timeout_ms", u))
    c.resp.connect_timeout_ms = clamp_u64(u, 1, 60 * 1000);
  if (extract_string(text, "resp_key_prefix", s))
    c.resp.key_prefix = s;
  if (extract_u64(text, "resp_scan_count", u))
    c.resp.scan_count = clamp_u64(u, 1, 100000);

  cfg = std::move(c);
  return true;
}

bool load_config(const std::string &path, CacheConfig &cfg, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

std::unique_ptr<IBackingStore> make_store(const CacheConfig &cfg) {
  if (cfg.store == "resp")
    return std::make_unique<RespStore>(cfg.resp);
  return std::make_unique<MemoryStore>(cfg.memory);
}

std::unique_ptr<TaggedCache> make_cache(const CacheConfig &cfg) {
  return std::make_unique<TaggedCache>(cfg.cache, make_store(cfg));
}

} // namespace tagcache
