#pragma once

#include "cachekit/cache.hpp"
#include "cachekit/config.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/memory_cache.hpp"
#include "cachekit/resp_store.hpp"

#include <memory>

namespace cachekit {

// Builds the backend named by cfg.type after normalizing and validating
// the configuration. Returns nullptr and fills *err when the
// configuration is rejected or the backend cannot start.
template <typename T>
std::unique_ptr<Cache<T>> make_cache(CacheConfig cfg, Error *err = nullptr) {
  normalize(cfg);
  Error e;
  if (!validate(cfg, &e)) {
    logger()->error("cache construction rejected: {}", e.message());
    if (err)
      *err = std::move(e);
    return nullptr;
  }
  set_log_level(cfg.log_level);
  if (cfg.type == kTypeRedis)
    return RespStore<T>::create(cfg, err);
  return MemoryCache<T>::create(cfg, err);
}

} // namespace cachekit
