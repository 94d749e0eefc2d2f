#include "tagcache/memory_store.hpp"

#include <algorithm>
#include <sstream>

namespace tagcache {

MemoryStore::MemoryStore(MemoryStoreConfig cfg) : cfg_(cfg) {}

bool MemoryStore::raw_get(const std::string &key, std::optional<Bytes> &out,
                          std::chrono::milliseconds, Error *) {
  std::lock_guard lk(mu_);
  const auto now = Clock::now();
  tick_locked(now);
  ++stats_.gets;
  out.reset();
  auto it = slots_.find(key);
  if (it == slots_.end())
    return true;
  if (it->second.deadline <= now) {
    erase_locked(key, true);
    return true;
  }
  out = it->second.value;
  return true;
}

bool MemoryStore::raw_set(const std::string &key, const Bytes &value,
                          std::chrono::milliseconds ttl,
                          std::chrono::milliseconds, Error *err) {
  if (key.empty())
    return fail(err, ErrorCode::InvalidArgument, "empty key");
  if (ttl.count() <= 0)
    return fail(err, ErrorCode::InvalidArgument, "ttl must be positive");

  std::lock_guard lk(mu_);
  const auto now = Clock::now();
  tick_locked(now);
  ++stats_.sets;

  auto &slot = slots_[key];
  bytes_used_ -= slot.value.size();
  slot.value = value;
  slot.deadline = now + ttl;
  slot.generation = ++generation_;
  bytes_used_ += slot.value.size();
  expiry_heap_.push({slot.deadline, key, slot.generation});
  return true;
}

bool MemoryStore::raw_del(const std::string &key, std::chrono::milliseconds,
                          Error *) {
  std::lock_guard lk(mu_);
  tick_locked(Clock::now());
  ++stats_.dels;
  erase_locked(key, false);
  return true;
}

bool MemoryStore::raw_scan_prefix(const std::string &prefix,
                                  std::vector<std::string> &out,
                                  std::chrono::milliseconds, Error *) {
  std::lock_guard lk(mu_);
  const auto now = Clock::now();
  tick_locked(now);
  out.clear();
  for (const auto &[k, slot] : slots_) {
    if (slot.deadline <= now)
      continue;
    if (k.compare(0, prefix.size(), prefix) == 0)
      out.push_back(k);
  }
  std::sort(out.begin(), out.end());
  return true;
}

void MemoryStore::tick() {
  std::lock_guard lk(mu_);
  tick_locked(Clock::now());
}

std::size_t MemoryStore::size() const {
  std::lock_guard lk(mu_);
  return slots_.size();
}

std::size_t MemoryStore::bytes_used() const {
  std::lock_guard lk(mu_);
  return bytes_used_;
}

MemoryStoreStats MemoryStore::stats() const {
  std::lock_guard lk(mu_);
  return stats_;
}

std::string MemoryStore::info() const {
  std::lock_guard lk(mu_);
  std::ostringstream os;
  os << "store:memory\n";
  os << "store_keys:" << slots_.size() << "\n";
  os << "store_bytes:" << bytes_used_ << "\n";
  os << "store_gets:" << stats_.gets << "\n";
  os << "store_sets:" << stats_.sets << "\n";
  os << "store_dels:" << stats_.dels << "\n";
  os << "store_expirations:" << stats_.expirations << "\n";
  return os.str();
}

void MemoryStore::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = slots_.find(key);
    // A newer set re-armed this key; its own node is still queued.
    if (it == slots_.end() || it->second.generation != gen)
      continue;
    erase_locked(key, true);
    ++cleaned;
  }
}

void MemoryStore::erase_locked(const std::string &key, bool expiration) {
  auto it = slots_.find(key);
  if (it == slots_.end())
    return;
  bytes_used_ -= it->second.value.size();
  slots_.erase(it);
  if (expiration)
    ++stats_.expirations;
}

} // namespace tagcache
