#pragma once

#include "tagcache/backing_store.hpp"
#include "tagcache/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tagcache {

struct TaggedCacheConfig {
  std::size_t max_key_len{256};
  std::size_t max_value_size{1024 * 1024};
  char namespace_separator{'_'};
  std::uint64_t op_timeout_ms{250};
  std::size_t expiry_cleanup_per_tick{128};
  std::size_t lock_stripes{64};
  bool log_events{false};
};

struct NamespaceStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
};

struct WarmEntry {
  std::string key;
  Bytes value;
  std::chrono::milliseconds ttl;
  TagSet tags;
};

// What fetch() does when the initial cache read fails.
enum class OnStoreError { Propagate, TreatAsMiss };

using Timeout = std::optional<std::chrono::milliseconds>;

// Tagged cache over a pluggable backing store.
//
// Values and their TTLs live in the store. Tag membership and liveness live
// here, in an index that has no TTL of its own and is pruned when its keys
// expire, are deleted, or are invalidated. A store value the index does not
// know is never served. Per-key operations serialize on a striped
// key lock; the index has its own mutex, always taken after the key lock.
class TaggedCache {
public:
  // Commits a write to the system of record. Returns false and fills *err
  // on failure.
  using Commit = std::function<bool(std::string *err)>;
  // Computes a value from the system of record; std::nullopt plus *err on
  // failure.
  using Loader = std::function<std::optional<Bytes>(std::string *err)>;

  TaggedCache(TaggedCacheConfig cfg, std::unique_ptr<IBackingStore> store);
  TaggedCache(const TaggedCache &) = delete;
  TaggedCache &operator=(const TaggedCache &) = delete;

  // std::nullopt with err->code == None means a plain miss.
  std::optional<Bytes> get(const std::string &key, Error *err = nullptr,
                           Timeout timeout = std::nullopt);
  bool set(const std::string &key, const Bytes &value,
           std::chrono::milliseconds ttl, const TagSet &tags,
           Error *err = nullptr, Timeout timeout = std::nullopt);
  bool del(const std::string &key, Error *err = nullptr,
           Timeout timeout = std::nullopt);
  // Returns the number of entries removed.
  std::size_t invalidate_tag(const std::string &tag, Error *err = nullptr,
                             Timeout timeout = std::nullopt);
  std::size_t invalidate_tags(const TagSet &tags, Error *err = nullptr,
                              Timeout timeout = std::nullopt);

  // Calls commit, then set() only if commit succeeded. A failed commit is
  // reported as ErrorCode::Upstream with the commit's message.
  bool write_through(const std::string &key, const Bytes &value,
                     std::chrono::milliseconds ttl, const TagSet &tags,
                     const Commit &commit, Error *err = nullptr,
                     Timeout timeout = std::nullopt);

  // Cache-aside read: get, and on a miss load and populate.
  std::optional<Bytes> fetch(const std::string &key,
                             std::chrono::milliseconds ttl, const TagSet &tags,
                             const Loader &loader,
                             OnStoreError on_store_error = OnStoreError::Propagate,
                             Error *err = nullptr,
                             Timeout timeout = std::nullopt);

  // Returns how many entries were cached; err holds the first failure.
  std::size_t warm(const std::vector<WarmEntry> &entries, Error *err = nullptr);

  NamespaceStats statistics(const std::string &ns) const;
  std::map<std::string, NamespaceStats> all_statistics() const;
  void reset_statistics(const std::string &ns);
  void reset_statistics();

  std::vector<std::string> keys_for_tag(const std::string &tag) const;
  TagSet tags_for_key(const std::string &key) const;
  std::size_t size() const;
  std::size_t tag_count() const;

  // Prunes at most expiry_cleanup_per_tick expired entries from the index
  // and the store. get() and set() also prune the index, bounded the same
  // way, so the index stays bounded without calling tick().
  void tick();
  std::string info() const;

  IBackingStore &store() { return *store_; }
  const TaggedCacheConfig &config() const { return cfg_; }

  static std::string namespace_of(const std::string &key, char separator);

private:
  struct KeyMeta {
    TagSet tags;
    TimePoint expires_at{};
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
  struct Counters {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
  };

  bool validate_key(const std::string &key, Error *err) const;
  bool validate_write(const std::string &key, const Bytes &value,
                      std::chrono::milliseconds ttl, const TagSet &tags,
                      Error *err) const;
  std::chrono::milliseconds timeout_or_default(Timeout timeout) const;
  std::shared_mutex &stripe_for(const std::string &key) const;
  Counters &counters_for(const std::string &key);
  void record(const std::string &key, bool hit);

  // The *_locked helpers require index_mu_.
  void index_locked(const std::string &key, KeyMeta meta);
  void erase_meta_locked(const std::string &key);
  void prune_expired_locked(TimePoint now);
  // Requires the key's stripe, not index_mu_.
  void prune_if_expired(const std::string &key, std::uint64_t generation,
                        std::chrono::milliseconds timeout);
  void log_event(const std::string &line) const;

  TaggedCacheConfig cfg_;
  std::unique_ptr<IBackingStore> store_;
  mutable std::vector<std::shared_mutex> stripes_;

  mutable std::mutex index_mu_;
  std::unordered_map<std::string, KeyMeta> meta_;
  std::unordered_map<std::string, std::unordered_set<std::string>> tag_index_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::uint64_t generation_{0};

  mutable std::shared_mutex counters_mu_;
  std::unordered_map<std::string, Counters> counters_;
  std::atomic<std::uint64_t> store_errors_{0};
  std::atomic<std::uint64_t> invalidations_{0};
  std::atomic<std::uint64_t> expired_pruned_{0};
};

} // namespace tagcache
