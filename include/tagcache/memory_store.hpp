#pragma once

#include "tagcache/backing_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagcache {

struct MemoryStoreConfig {
  std::size_t ttl_cleanup_per_tick{128};
};

struct MemoryStoreStats {
  std::uint64_t gets{0};
  std::uint64_t sets{0};
  std::uint64_t dels{0};
  std::uint64_t expirations{0};
};

class MemoryStore : public IBackingStore {
public:
  explicit MemoryStore(MemoryStoreConfig cfg = {});

  std::string name() const override { return "memory"; }
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

  // Purges at most ttl_cleanup_per_tick expired entries.
  void tick();

  std::size_t size() const;
  std::size_t bytes_used() const;
  MemoryStoreStats stats() const;
  std::string info() const;

private:
  struct Slot {
    Bytes value;
    TimePoint deadline{};
    std::uint64_t generation{0};
  };
  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  void tick_locked(TimePoint now);
  void erase_locked(const std::string &key, bool expiration);

  MemoryStoreConfig cfg_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Slot> slots_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::uint64_t generation_{0};
  std::size_t bytes_used_{0};
  MemoryStoreStats stats_;
};

} // namespace tagcache
