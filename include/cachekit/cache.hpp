#pragma once

#include "cachekit/context.hpp"
#include "cachekit/error.hpp"
#include "cachekit/metrics.hpp"
#include "cachekit/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cachekit {

// Contract shared by every backend. A ttl of zero or less selects the
// configured default. A missing key fails get() with ErrorCode::CacheMiss.
template <typename T> class Cache {
public:
  virtual ~Cache() = default;

  virtual std::optional<T> get(const Context &ctx, const std::string &key,
                               Error *err = nullptr) = 0;
  virtual bool set(const Context &ctx, const std::string &key,
                   const T &value, Duration ttl, Error *err = nullptr) = 0;
  virtual bool del(const Context &ctx, const std::vector<std::string> &keys,
                   Error *err = nullptr) = 0;
  virtual std::optional<bool> exists(const Context &ctx,
                                     const std::string &key,
                                     Error *err = nullptr) = 0;
  virtual bool clear(const Context &ctx, Error *err = nullptr) = 0;
  virtual std::optional<std::size_t> len(const Context &ctx,
                                         Error *err = nullptr) = 0;
  virtual bool close(Error *err = nullptr) = 0;
  virtual bool ping(const Context &ctx, Error *err = nullptr) = 0;
};

template <typename T> using ValueMap = std::unordered_map<std::string, T>;

/* Optional capabilities a backend may implement next to Cache<T>. */

template <typename T> class PipelineGetter {
public:
  virtual ~PipelineGetter() = default;
  // Keys that miss are omitted from the result.
  virtual std::optional<ValueMap<T>>
  get_many_pipeline(const Context &ctx, const std::vector<std::string> &keys,
                    Error *err = nullptr) = 0;
};

template <typename T> class PipelineSetter {
public:
  virtual ~PipelineSetter() = default;
  virtual bool set_many_pipeline(const Context &ctx, const ValueMap<T> &items,
                                 Duration ttl, Error *err = nullptr) = 0;
};

class PrefixDeleter {
public:
  virtual ~PrefixDeleter() = default;
  virtual std::optional<std::size_t>
  delete_by_prefix(const Context &ctx, const std::string &prefix,
                   Error *err = nullptr) = 0;
};

class StatProvider {
public:
  virtual ~StatProvider() = default;
  virtual CacheStats stats(const Context &ctx) = 0;
};

class DistributedLocker {
public:
  virtual ~DistributedLocker() = default;
  // Single non-blocking attempt. Returns false (no error) when the lock is
  // held elsewhere.
  virtual std::optional<bool> try_lock(const Context &ctx,
                                       const std::string &key, Duration ttl,
                                       Error *err = nullptr) = 0;
  virtual bool unlock(const Context &ctx, const std::string &key,
                      Error *err = nullptr) = 0;
};

// Capabilities of a store, resolved once when a decorator is built.
template <typename T> struct StoreCapabilities {
  PipelineGetter<T> *pipeline_getter{nullptr};
  PipelineSetter<T> *pipeline_setter{nullptr};
  PrefixDeleter *prefix_deleter{nullptr};
  StatProvider *stat_provider{nullptr};
  DistributedLocker *locker{nullptr};

  static StoreCapabilities probe(Cache<T> &store) {
    StoreCapabilities c;
    c.pipeline_getter = dynamic_cast<PipelineGetter<T> *>(&store);
    c.pipeline_setter = dynamic_cast<PipelineSetter<T> *>(&store);
    c.prefix_deleter = dynamic_cast<PrefixDeleter *>(&store);
    c.stat_provider = dynamic_cast<StatProvider *>(&store);
    c.locker = dynamic_cast<DistributedLocker *>(&store);
    return c;
  }
};

} // namespace cachekit
