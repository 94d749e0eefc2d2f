#pragma once

#include "tagcache/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tagcache {

// Minimal key-value capability the cache engine delegates values and TTLs to.
// Every call returns false and fills *err on failure; a missing key is not a
// failure (raw_get succeeds with out == std::nullopt).
class IBackingStore {
public:
  virtual ~IBackingStore() = default;
  virtual std::string name() const = 0;
  virtual bool raw_get(const std::string &key, std::optional<Bytes> &out,
                       std::chrono::milliseconds timeout,
                       Error *err = nullptr) = 0;
  virtual bool raw_set(const std::string &key, const Bytes &value,
                       std::chrono::milliseconds ttl,
                       std::chrono::milliseconds timeout,
                       Error *err = nullptr) = 0;
  virtual bool raw_del(const std::string &key, std::chrono::milliseconds timeout,
                       Error *err = nullptr) = 0;
  virtual bool raw_scan_prefix(const std::string &prefix,
                               std::vector<std::string> &out,
                               std::chrono::milliseconds timeout,
                               Error *err = nullptr) = 0;
};

} // namespace tagcache
