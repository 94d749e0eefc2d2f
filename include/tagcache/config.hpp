#pragma once

#include "tagcache/memory_store.hpp"
#include "tagcache/resp_store.hpp"
#include "tagcache/tagged_cache.hpp"

#include <memory>
#include <string>

namespace tagcache {

struct CacheConfig {
  std::string store{"memory"};
  TaggedCacheConfig cache;
  MemoryStoreConfig memory;
  RespStoreConfig resp;
};

// Reads a flat JSON object. Present fields are clamped and applied; on any
// error cfg is left untouched.
bool load_config(const std::string &path, CacheConfig &cfg,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, CacheConfig &cfg,
                  std::string *err = nullptr);

std::unique_ptr<IBackingStore> make_store(const CacheConfig &cfg);
std::unique_ptr<TaggedCache> make_cache(const CacheConfig &cfg);

} // namespace tagcache
