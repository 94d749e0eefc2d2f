#include "tagcache/tagged_cache.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tagcache {

TaggedCache::TaggedCache(TaggedCacheConfig cfg,
                         std::unique_ptr<IBackingStore> store)
    : cfg_(std::move(cfg)), store_(std::move(store)),
      stripes_(std::max<std::size_t>(1, cfg_.lock_stripes)) {
  if (!store_)
    throw std::invalid_argument("TaggedCache requires a backing store");
}

std::string TaggedCache::namespace_of(const std::string &key, char separator) {
  const auto pos = key.find(separator);
  if (pos == std::string::npos)
    return key;
  return key.substr(0, pos);
}

std::optional<Bytes> TaggedCache::get(const std::string &key, Error *err,
                                      Timeout timeout) {
  if (err)
    *err = Error{};
  if (!validate_key(key, err))
    return std::nullopt;

  std::shared_lock klk(stripe_for(key));
  std::optional<TimePoint> expires_at;
  std::uint64_t generation = 0;
  {
    std::lock_guard ilk(index_mu_);
    prune_expired_locked(Clock::now());
    auto it = meta_.find(key);
    if (it != meta_.end()) {
      expires_at = it->second.expires_at;
      generation = it->second.generation;
    }
  }
  // The index decides liveness. A store value with no live entry here was
  // written by another instance or outlived its ttl, and is never served.
  if (!expires_at) {
    record(key, false);
    return std::nullopt;
  }
  if (*expires_at <= Clock::now()) {
    prune_if_expired(key, generation, timeout_or_default(timeout));
    record(key, false);
    return std::nullopt;
  }

  std::optional<Bytes> value;
  Error store_err;
  if (!store_->raw_get(key, value, timeout_or_default(timeout), &store_err)) {
    ++store_errors_;
    record(key, false);
    log_event("get " + key + " failed: " + store_err.message);
    if (err)
      *err = std::move(store_err);
    return std::nullopt;
  }
  // The store's own TTL may trail ours by the latency of the write.
  if (value && *expires_at <= Clock::now())
    value.reset();
  record(key, value.has_value());
  return value;
}

bool TaggedCache::set(const std::string &key, const Bytes &value,
                      std::chrono::milliseconds ttl, const TagSet &tags,
                      Error *err, Timeout timeout) {
  if (err)
    *err = Error{};
  if (!validate_write(key, value, ttl, tags, err))
    return false;

  std::unique_lock klk(stripe_for(key));
  const auto expires_at = Clock::now() + ttl;
  Error store_err;
  const bool stored = store_->raw_set(key, value, ttl,
                                      timeout_or_default(timeout), &store_err);

  std::lock_guard ilk(index_mu_);
  prune_expired_locked(Clock::now());
  if (stored) {
    index_locked(key, KeyMeta{tags, expires_at, 0});
    return true;
  }

  // The write may or may not have landed. Keep the old memberships and add
  // the new ones so an invalidation of either tag still reaches the key.
  KeyMeta merged{tags, expires_at, 0};
  if (auto it = meta_.find(key); it != meta_.end()) {
    merged.tags.insert(it->second.tags.begin(), it->second.tags.end());
    merged.expires_at = std::max(merged.expires_at, it->second.expires_at);
  }
  index_locked(key, std::move(merged));
  ++store_errors_;
  log_event("set " + key + " failed: " + store_err.message);
  if (err)
    *err = std::move(store_err);
  return false;
}

bool TaggedCache::del(const std::string &key, Error *err, Timeout timeout) {
  if (err)
    *err = Error{};
  if (!validate_key(key, err))
    return false;

  std::unique_lock klk(stripe_for(key));
  Error store_err;
  if (!store_->raw_del(key, timeout_or_default(timeout), &store_err)) {
    ++store_errors_;
    log_event("del " + key + " failed: " + store_err.message);
    if (err)
      *err = std::move(store_err);
    return false;
  }
  std::lock_guard ilk(index_mu_);
  erase_meta_locked(key);
  return true;
}

std::size_t TaggedCache::invalidate_tag(const std::string &tag, Error *err,
                                        Timeout timeout) {
  if (err)
    *err = Error{};
  if (tag.empty()) {
    fail(err, ErrorCode::InvalidArgument, "empty tag");
    return 0;
  }

  std::vector<std::string> members;
  {
    std::lock_guard ilk(index_mu_);
    auto it = tag_index_.find(tag);
    if (it == tag_index_.end())
      return 0;
    members.assign(it->second.begin(), it->second.end());
  }
  std::sort(members.begin(), members.end());

  const auto t = timeout_or_default(timeout);
  std::size_t removed = 0;
  for (const auto &key : members) {
    std::unique_lock klk(stripe_for(key));
    {
      std::lock_guard ilk(index_mu_);
      auto it = meta_.find(key);
      // Deleted, expired, or re-set without this tag since the snapshot.
      if (it == meta_.end() || !it->second.tags.contains(tag))
        continue;
    }
    Error store_err;
    if (!store_->raw_del(key, t, &store_err)) {
      // Unprocessed members stay indexed under the tag so a retry finishes.
      ++store_errors_;
      invalidations_ += removed;
      log_event("invalidate " + tag + " stopped at " + key + ": " +
                store_err.message);
      if (err)
        *err = std::move(store_err);
      return removed;
    }
    std::lock_guard ilk(index_mu_);
    erase_meta_locked(key);
    ++removed;
  }
  invalidations_ += removed;
  log_event("invalidated tag " + tag + ": " + std::to_string(removed) +
            " entries");
  return removed;
}

std::size_t TaggedCache::invalidate_tags(const TagSet &tags, Error *err,
                                         Timeout timeout) {
  if (err)
    *err = Error{};
  std::size_t removed = 0;
  for (const auto &tag : tags) {
    Error tag_err;
    removed += invalidate_tag(tag, &tag_err, timeout);
    if (tag_err) {
      if (err)
        *err = std::move(tag_err);
      return removed;
    }
  }
  return removed;
}

bool TaggedCache::write_through(const std::string &key, const Bytes &value,
                                std::chrono::milliseconds ttl,
                                const TagSet &tags, const Commit &commit,
                                Error *err, Timeout timeout) {
  if (err)
    *err = Error{};
  if (!validate_write(key, value, ttl, tags, err))
    return false;
  std::string upstream_err;
  if (!commit(&upstream_err))
    return fail(err, ErrorCode::Upstream, std::move(upstream_err));
  return set(key, value, ttl, tags, err, timeout);
}

std::optional<Bytes> TaggedCache::fetch(const std::string &key,
                                        std::chrono::milliseconds ttl,
                                        const TagSet &tags,
                                        const Loader &loader,
                                        OnStoreError on_store_error,
                                        Error *err, Timeout timeout) {
  if (err)
    *err = Error{};
  if (!validate_write(key, Bytes{}, ttl, tags, err))
    return std::nullopt;

  Error read_err;
  if (auto cached = get(key, &read_err, timeout))
    return cached;
  if (read_err && on_store_error == OnStoreError::Propagate) {
    if (err)
      *err = std::move(read_err);
    return std::nullopt;
  }

  std::string load_err;
  auto fresh = loader(&load_err);
  if (!fresh) {
    fail(err, ErrorCode::Upstream, std::move(load_err));
    return std::nullopt;
  }
  Error write_err;
  if (!set(key, *fresh, ttl, tags, &write_err, timeout) && err)
    *err = std::move(write_err);
  return fresh;
}

std::size_t TaggedCache::warm(const std::vector<WarmEntry> &entries,
                              Error *err) {
  if (err)
    *err = Error{};
  std::size_t cached = 0;
  for (const auto &e : entries) {
    Error entry_err;
    if (set(e.key, e.value, e.ttl, e.tags, &entry_err))
      ++cached;
    else if (err && !*err)
      *err = std::move(entry_err);
  }
  log_event("warmed " + std::to_string(cached) + "/" +
            std::to_string(entries.size()) + " entries");
  return cached;
}

NamespaceStats TaggedCache::statistics(const std::string &ns) const {
  std::shared_lock lk(counters_mu_);
  auto it = counters_.find(ns);
  if (it == counters_.end())
    return {};
  return {it->second.hits.load(std::memory_order_relaxed),
          it->second.misses.load(std::memory_order_relaxed)};
}

std::map<std::string, NamespaceStats> TaggedCache::all_statistics() const {
  std::shared_lock lk(counters_mu_);
  std::map<std::string, NamespaceStats> out;
  for (const auto &[ns, c] : counters_)
    out[ns] = {c.hits.load(std::memory_order_relaxed),
               c.misses.load(std::memory_order_relaxed)};
  return out;
}

void TaggedCache::reset_statistics(const std::string &ns) {
  std::shared_lock lk(counters_mu_);
  auto it = counters_.find(ns);
  if (it == counters_.end())
    return;
  it->second.hits.store(0, std::memory_order_relaxed);
  it->second.misses.store(0, std::memory_order_relaxed);
}

void TaggedCache::reset_statistics() {
  // Entries are zeroed, not erased: record() may hold a reference.
  std::shared_lock lk(counters_mu_);
  for (auto &[ns, c] : counters_) {
    c.hits.store(0, std::memory_order_relaxed);
    c.misses.store(0, std::memory_order_relaxed);
  }
}

std::vector<std::string> TaggedCache::keys_for_tag(const std::string &tag) const {
  std::lock_guard ilk(index_mu_);
  std::vector<std::string> out;
  auto it = tag_index_.find(tag);
  if (it != tag_index_.end())
    out.assign(it->second.begin(), it->second.end());
  std::sort(out.begin(), out.end());
  return out;
}

TagSet TaggedCache::tags_for_key(const std::string &key) const {
  std::lock_guard ilk(index_mu_);
  auto it = meta_.find(key);
  if (it == meta_.end())
    return {};
  return it->second.tags;
}

std::size_t TaggedCache::size() const {
  std::lock_guard ilk(index_mu_);
  return meta_.size();
}

std::size_t TaggedCache::tag_count() const {
  std::lock_guard ilk(index_mu_);
  return tag_index_.size();
}

void TaggedCache::tick() {
  std::vector<std::pair<std::string, std::uint64_t>> due;
  {
    std::lock_guard ilk(index_mu_);
    const auto now = Clock::now();
    while (!expiry_heap_.empty() && due.size() < cfg_.expiry_cleanup_per_tick) {
      const auto &node = expiry_heap_.top();
      if (node.deadline > now)
        break;
      auto it = meta_.find(node.key);
      if (it != meta_.end() && it->second.generation == node.generation)
        due.emplace_back(node.key, node.generation);
      expiry_heap_.pop();
    }
  }
  // Store deletes need the key's stripe, which must be taken before
  // index_mu_.
  const auto timeout = std::chrono::milliseconds(cfg_.op_timeout_ms);
  for (const auto &[key, generation] : due) {
    std::unique_lock klk(stripe_for(key));
    prune_if_expired(key, generation, timeout);
  }
}

std::string TaggedCache::info() const {
  std::ostringstream os;
  os << "store:" << store_->name() << "\n";
  {
    std::lock_guard ilk(index_mu_);
    os << "keys:" << meta_.size() << "\n";
    os << "tags:" << tag_index_.size() << "\n";
  }
  const auto per_ns = all_statistics();
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  for (const auto &[ns, s] : per_ns) {
    hits += s.hits;
    misses += s.misses;
  }
  os << "hits:" << hits << "\n";
  os << "misses:" << misses << "\n";
  os << "store_errors:" << store_errors_.load() << "\n";
  os << "invalidations:" << invalidations_.load() << "\n";
  os << "expired_pruned:" << expired_pruned_.load() << "\n";
  for (const auto &[ns, s] : per_ns) {
    os << "ns." << ns << ".hits:" << s.hits << "\n";
    os << "ns." << ns << ".misses:" << s.misses << "\n";
  }
  return os.str();
}

bool TaggedCache::validate_key(const std::string &key, Error *err) const {
  if (key.empty())
    return fail(err, ErrorCode::InvalidArgument, "empty key");
  if (key.size() > cfg_.max_key_len)
    return fail(err, ErrorCode::InvalidArgument, "key too long");
  return true;
}

bool TaggedCache::validate_write(const std::string &key, const Bytes &value,
                                 std::chrono::milliseconds ttl,
                                 const TagSet &tags, Error *err) const {
  if (!validate_key(key, err))
    return false;
  if (ttl.count() <= 0)
    return fail(err, ErrorCode::InvalidArgument, "ttl must be positive");
  if (value.size() > cfg_.max_value_size)
    return fail(err, ErrorCode::InvalidArgument, "value too large");
  for (const auto &tag : tags) {
    if (tag.empty())
      return fail(err, ErrorCode::InvalidArgument, "empty tag");
  }
  return true;
}

std::chrono::milliseconds TaggedCache::timeout_or_default(Timeout timeout) const {
  if (timeout)
    return *timeout;
  return std::chrono::milliseconds(cfg_.op_timeout_ms);
}

std::shared_mutex &TaggedCache::stripe_for(const std::string &key) const {
  return stripes_[std::hash<std::string>{}(key) % stripes_.size()];
}

TaggedCache::Counters &TaggedCache::counters_for(const std::string &key) {
  const auto ns = namespace_of(key, cfg_.namespace_separator);
  {
    std::shared_lock lk(counters_mu_);
    auto it = counters_.find(ns);
    if (it != counters_.end())
      return it->second;
  }
  std::unique_lock lk(counters_mu_);
  return counters_[ns];
}

void TaggedCache::record(const std::string &key, bool hit) {
  auto &c = counters_for(key);
  (hit ? c.hits : c.misses).fetch_add(1, std::memory_order_relaxed);
}

void TaggedCache::index_locked(const std::string &key, KeyMeta meta) {
  erase_meta_locked(key);
  meta.generation = ++generation_;
  for (const auto &tag : meta.tags)
    tag_index_[tag].insert(key);
  expiry_heap_.push({meta.expires_at, key, meta.generation});
  meta_.emplace(key, std::move(meta));
  // Overwrites leave stale nodes behind until their deadline; rebuild when
  // they dominate.
  if (expiry_heap_.size() > 2 * meta_.size() + 1024) {
    decltype(expiry_heap_) fresh;
    for (const auto &[k, m] : meta_)
      fresh.push({m.expires_at, k, m.generation});
    expiry_heap_ = std::move(fresh);
  }
}

void TaggedCache::erase_meta_locked(const std::string &key) {
  auto it = meta_.find(key);
  if (it == meta_.end())
    return;
  for (const auto &tag : it->second.tags) {
    auto t = tag_index_.find(tag);
    if (t == tag_index_.end())
      continue;
    t->second.erase(key);
    if (t->second.empty())
      tag_index_.erase(t);
  }
  meta_.erase(it);
}

void TaggedCache::prune_if_expired(const std::string &key,
                                   std::uint64_t generation,
                                   std::chrono::milliseconds timeout) {
  {
    std::lock_guard ilk(index_mu_);
    auto it = meta_.find(key);
    if (it == meta_.end() || it->second.generation != generation ||
        it->second.expires_at > Clock::now())
      return;
    erase_meta_locked(key);
    ++expired_pruned_;
  }
  // The store ttl may trail ours; drop the value now. A failure here only
  // delays reclaiming it, the entry is already dead in the index.
  Error store_err;
  if (!store_->raw_del(key, timeout, &store_err)) {
    ++store_errors_;
    log_event("prune " + key + " failed: " + store_err.message);
  }
}

void TaggedCache::prune_expired_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.expiry_cleanup_per_tick) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    auto it = meta_.find(node.key);
    const bool live =
        it != meta_.end() && it->second.generation == node.generation;
    const auto key = node.key;
    expiry_heap_.pop();
    // Stale node: the key was re-set, deleted, or already pruned.
    if (!live)
      continue;
    erase_meta_locked(key);
    ++expired_pruned_;
    ++cleaned;
  }
}

void TaggedCache::log_event(const std::string &line) const {
  if (cfg_.log_events)
    std::clog << "[tagcache] " << line << std::endl;
}

} // namespace tagcache
