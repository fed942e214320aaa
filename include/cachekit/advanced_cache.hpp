#pragma once

#include "cachekit/cache.hpp"
#include "cachekit/config.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/metrics.hpp"
#include "cachekit/pipeline.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cachekit {

// Decorator adding metrics, stampede protection and batch operations on
// top of any Cache<T>. The wrapped store must outlive the decorator, and
// so must any TaskPool passed to set_detached().
inline constexpr Duration kDefaultLockLease{std::chrono::seconds(30)};

template <typename T>
class AdvancedCache final : public Cache<T>,
                            public PipelineGetter<T>,
                            public PipelineSetter<T>,
                            public PrefixDeleter,
                            public StatProvider {
public:
  // Produces the value for a missing key. Returning nullopt without an
  // error is reported as ErrorCode::ComputeFailed.
  using Compute = std::function<std::optional<T>(Error *err)>;

  explicit AdvancedCache(Cache<T> &store, const CacheConfig &cfg = {})
      : store_(store), caps_(StoreCapabilities<T>::probe(store)),
        metrics_(cfg.metrics_enabled),
        concurrency_(cfg.pipeline_concurrency > 0 ? cfg.pipeline_concurrency
                                                  : kDefaultPipelineConcurrency),
        lock_lease_(cfg.lock_lease.count() > 0 ? cfg.lock_lease
                                               : kDefaultLockLease),
        refresh_ttl_on_hit_(cfg.refresh_ttl_on_hit) {
    logger()->debug("advanced cache: pipeline_get={} pipeline_set={} "
                    "prefix_delete={} stats={} locking={}",
                    caps_.pipeline_getter != nullptr,
                    caps_.pipeline_setter != nullptr,
                    caps_.prefix_deleter != nullptr,
                    caps_.stat_provider != nullptr, caps_.locker != nullptr);
  }

  AdvancedCache(const AdvancedCache &) = delete;
  AdvancedCache &operator=(const AdvancedCache &) = delete;

  std::optional<T> get(const Context &ctx, const std::string &key,
                       Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    auto v = store_.get(ctx, key, &e);
    finish(op::kGet, start, 1, e);
    if (v) {
      metrics_.record_hit(op::kGet);
      return v;
    }
    if (is_cache_miss(e))
      metrics_.record_miss(op::kGet);
    return fail(std::move(e), err);
  }

  bool set(const Context &ctx, const std::string &key, const T &value,
           Duration ttl, Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    const bool ok = store_.set(ctx, key, value, ttl, &e);
    finish(op::kSet, start, 1, e);
    return ok || fail_bool(std::move(e), err);
  }

  bool del(const Context &ctx, const std::vector<std::string> &keys,
           Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    const bool ok = store_.del(ctx, keys, &e);
    finish(op::kDelete, start, keys.size(), e);
    return ok || fail_bool(std::move(e), err);
  }

  std::optional<bool> exists(const Context &ctx, const std::string &key,
                             Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    auto v = store_.exists(ctx, key, &e);
    finish(op::kExists, start, 1, e);
    return v ? v : fail(std::move(e), err);
  }

  bool clear(const Context &ctx, Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    const bool ok = store_.clear(ctx, &e);
    finish(op::kClear, start, 1, e);
    return ok || fail_bool(std::move(e), err);
  }

  std::optional<std::size_t> len(const Context &ctx,
                                 Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    auto v = store_.len(ctx, &e);
    finish(op::kLen, start, 1, e);
    return v ? v : fail(std::move(e), err);
  }

  bool close(Error *err = nullptr) override { return store_.close(err); }

  bool ping(const Context &ctx, Error *err = nullptr) override {
    return store_.ping(ctx, err);
  }

  std::optional<T> get_or_set(const Context &ctx, const std::string &key,
                              Duration ttl, const Compute &compute,
                              Error *err = nullptr) {
    const auto start = Clock::now();
    Error e;
    auto v = get_or_compute(ctx, op::kGetOrSet, key, ttl, compute, false, &e);
    finish(op::kGetOrSet, start, 1, e);
    return v ? v : fail(std::move(e), err);
  }

  // Like get_or_set(), but compute and the population write run while
  // holding the store's lock for key. Without a locking store this is
  // get_or_set(). A lock held elsewhere fails with LockAcquire.
  std::optional<T> get_or_set_locked(const Context &ctx,
                                     const std::string &key, Duration ttl,
                                     const Compute &compute,
                                     Error *err = nullptr) {
    const auto start = Clock::now();
    Error e;
    auto v = get_or_compute(ctx, op::kGetOrSetLocked, key, ttl, compute,
                            caps_.locker != nullptr, &e);
    finish(op::kGetOrSetLocked, start, 1, e);
    return v ? v : fail(std::move(e), err);
  }

  // Missing keys and per-key failures are left out of the result. Only a
  // canceled or expired context fails the call, and then no partial
  // result is returned.
  std::optional<ValueMap<T>>
  get_many_pipeline(const Context &ctx, const std::vector<std::string> &keys,
                    Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    std::optional<ValueMap<T>> out;
    if (caps_.pipeline_getter)
      out = caps_.pipeline_getter->get_many_pipeline(ctx, keys, &e);
    else
      out = fan_out_get(ctx, keys, &e);
    finish(op::kGetManyPipeline, start, keys.size(), e);
    if (!out)
      return fail(std::move(e), err);
    metrics_.record_hit(op::kGetManyPipeline, out->size());
    if (keys.size() > out->size())
      metrics_.record_miss(op::kGetManyPipeline, keys.size() - out->size());
    return out;
  }

  // The first failing write aborts the rest of the batch.
  bool set_many_pipeline(const Context &ctx, const ValueMap<T> &items,
                         Duration ttl, Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    bool ok = false;
    if (caps_.pipeline_setter) {
      ok = caps_.pipeline_setter->set_many_pipeline(ctx, items, ttl, &e);
    } else {
      std::vector<BatchTask> tasks;
      tasks.reserve(items.size());
      for (const auto &item : items) {
        tasks.push_back([this, &item, ttl](const Context &c, Error *te) {
          return store_.set(c, item.first, item.second, ttl, te);
        });
      }
      ok = run_bounded(ctx, tasks, concurrency_, op::kSetManyPipeline, &e);
    }
    finish(op::kSetManyPipeline, start, items.size(), e);
    return ok || fail_bool(std::move(e), err);
  }

  std::optional<std::size_t> delete_by_prefix(const Context &ctx,
                                              const std::string &prefix,
                                              Error *err = nullptr) override {
    const auto start = Clock::now();
    Error e;
    std::optional<std::size_t> removed;
    if (caps_.prefix_deleter)
      removed = caps_.prefix_deleter->delete_by_prefix(ctx, prefix, &e);
    else
      e = make_error(ErrorCode::Unsupported, op::kDeleteByPrefix, prefix,
                     "store has no prefix delete");
    finish(op::kDeleteByPrefix, start, removed.value_or(0), e);
    return removed ? removed : fail(std::move(e), err);
  }

  // Store-native counters (items, evictions, expirations, uptime) with the
  // hit/miss counts recorded by this layer.
  CacheStats stats(const Context &ctx) override {
    CacheStats s;
    if (caps_.stat_provider) {
      s = caps_.stat_provider->stats(ctx);
    } else {
      s.backend = "unknown";
      if (auto n = store_.len(ctx))
        s.items = *n;
    }
    s.hits = 0;
    s.misses = 0;
    for (const auto &[name, snap] : metrics_.snapshot()) {
      s.hits += snap.hits;
      s.misses += snap.misses;
    }
    s.hit_rate = cachekit::hit_rate(s.hits, s.misses);
    s.refresh_ttl_on_hit = refresh_ttl_on_hit_;
    return s;
  }

  // Queues a write that runs under its own budget, unaffected by the
  // caller's context. False when the pool rejects the task.
  bool set_detached(TaskPool &pool, const std::string &key, T value,
                    Duration ttl, Duration budget) {
    return pool.submit(
        [this, key, value = std::move(value), ttl](const Context &ctx) {
          Error e;
          if (!set(ctx, key, value, ttl, &e))
            logger()->warn("detached set failed: {}", e.message());
        },
        budget);
  }

  MetricsCollector &metrics() { return metrics_; }
  const MetricsCollector &metrics() const { return metrics_; }
  const StoreCapabilities<T> &capabilities() const { return caps_; }

private:
  // Releases a held key lock on scope exit, whatever the caller's context.
  class LockGuard {
  public:
    LockGuard(DistributedLocker &locker, MetricsCollector &metrics,
              const std::string &key)
        : locker_(locker), metrics_(metrics), key_(key) {}
    ~LockGuard() {
      Error e;
      if (!locker_.unlock(Context::background(), key_, &e)) {
        metrics_.record_error(op::kGetOrSetLocked);
        logger()->warn("lock release failed: {}", e.message());
      }
    }
    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;

  private:
    DistributedLocker &locker_;
    MetricsCollector &metrics_;
    const std::string &key_;
  };

  std::optional<T> get_or_compute(const Context &ctx, std::string_view op,
                                  const std::string &key, Duration ttl,
                                  const Compute &compute, bool locked,
                                  Error *err) {
    Error e;
    if (auto v = get(ctx, key, &e))
      return v;
    if (!is_cache_miss(e))
      return fail(std::move(e), err);
    if (!locked)
      return populate(ctx, op, key, ttl, compute, err);

    auto acquired = caps_.locker->try_lock(ctx, key, lock_lease_, &e);
    if (!acquired)
      return fail(std::move(e), err);
    if (!*acquired)
      return fail(make_error(ErrorCode::LockAcquire, op, key,
                             "lock held by another caller"),
                  err);
    LockGuard guard(*caps_.locker, metrics_, key);

    // Another holder may have filled the key between our miss and the lock.
    Error again;
    if (auto v = store_.get(ctx, key, &again))
      return v;
    if (!is_cache_miss(again))
      return fail(std::move(again), err);
    return populate(ctx, op, key, ttl, compute, err);
  }

  std::optional<T> populate(const Context &ctx, std::string_view op,
                            const std::string &key, Duration ttl,
                            const Compute &compute, Error *err) {
    Error e;
    auto v = compute(&e);
    if (!v) {
      if (e.ok())
        e = make_error(ErrorCode::ComputeFailed, op, key);
      if (e.op.empty())
        e.op = std::string(op);
      if (e.key.empty())
        e.key = key;
      return fail(std::move(e), err);
    }
    Error set_err;
    if (!set(ctx, key, *v, ttl, &set_err))
      logger()->debug("{}: populating '{}' failed: {}", op, key,
                      set_err.message());
    return v;
  }

  std::optional<ValueMap<T>> fan_out_get(const Context &ctx,
                                         const std::vector<std::string> &keys,
                                         Error *err) {
    ValueMap<T> out;
    std::mutex out_mutex;
    std::vector<BatchTask> tasks;
    tasks.reserve(keys.size());
    for (const auto &key : keys) {
      tasks.push_back([this, &key, &out, &out_mutex](const Context &c,
                                                     Error *te) {
        Error e;
        auto v = store_.get(c, key, &e);
        if (v) {
          std::lock_guard lock(out_mutex);
          out.emplace(key, std::move(*v));
          return true;
        }
        if (!is_context_error(e))
          return true;
        if (te)
          *te = std::move(e);
        return false;
      });
    }
    if (!run_bounded(ctx, tasks, concurrency_, op::kGetManyPipeline, err))
      return std::nullopt;
    return out;
  }

  void finish(std::string_view op, Clock::time_point start, std::size_t items,
              const Error &e) {
    metrics_.record_operation(
        op, std::chrono::duration_cast<Nanos>(Clock::now() - start), items);
    if (!e.ok() && !is_cache_miss(e))
      metrics_.record_error(op);
  }

  static std::nullopt_t fail(Error e, Error *err) {
    if (err)
      *err = std::move(e);
    return std::nullopt;
  }

  static bool fail_bool(Error e, Error *err) {
    if (err)
      *err = std::move(e);
    return false;
  }

  Cache<T> &store_;
  const StoreCapabilities<T> caps_;
  MetricsCollector metrics_;
  const std::size_t concurrency_;
  const Duration lock_lease_;
  const bool refresh_ttl_on_hit_;
};

} // namespace cachekit
