#pragma once

#include "cachekit/cache.hpp"
#include "cachekit/config.hpp"
#include "cachekit/key_policy.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/lru_store.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace cachekit {

// In-process backend: an LruStore of entries with absolute expiry, a lazy
// expiry check on access and a background sweep. Also provides prefix
// delete, stats and an in-process lease lock table.
template <typename T>
class MemoryCache final : public Cache<T>,
                          public PrefixDeleter,
                          public StatProvider,
                          public DistributedLocker {
public:
  // Returns nullptr and fills *err when the eviction policy is not LRU.
  static std::unique_ptr<MemoryCache> create(const CacheConfig &cfg,
                                             Error *err = nullptr) {
    if (!cfg.eviction_policy.empty() && cfg.eviction_policy != kEvictLru) {
      logger()->error("memory cache: unsupported eviction policy '{}'",
                      cfg.eviction_policy);
      if (err)
        *err = make_error(ErrorCode::InvalidConfig, op::kInit, {},
                          "eviction policy '" + cfg.eviction_policy +
                              "' is not implemented");
      return nullptr;
    }
    return std::make_unique<MemoryCache>(Token{}, cfg);
  }

private:
  struct Token {
    explicit Token() = default;
  };

public:
  MemoryCache(Token, const CacheConfig &cfg)
      : policy_(cfg.prefix, cfg.ttl), store_(cfg.max_entries),
        refresh_on_hit_(cfg.refresh_ttl_on_hit),
        sweep_interval_(cfg.cleanup_interval), started_(Clock::now()) {
    if (sweep_interval_.count() > 0)
      sweeper_ = std::thread([this] { sweep_loop(); });
    logger()->info("memory cache created: max_entries={} ttl_ms={} "
                   "cleanup_interval_ms={} prefix='{}'",
                   cfg.max_entries, cfg.ttl.count(),
                   cfg.cleanup_interval.count(), cfg.prefix);
  }

  ~MemoryCache() override { stop_sweep(); }

  MemoryCache(const MemoryCache &) = delete;
  MemoryCache &operator=(const MemoryCache &) = delete;

  std::optional<T> get(const Context &ctx, const std::string &key,
                       Error *err = nullptr) override {
    if (!policy_.validate(key, op::kGet, err) ||
        !ctx.check(op::kGet, key, err))
      return std::nullopt;

    const auto now = Clock::now();
    bool expired = false;
    auto item = store_.get_if(policy_.full_key(key), [&](Item &it) {
      if (is_expired(it, now)) {
        expired = true;
        return false;
      }
      if (refresh_on_hit_)
        extend_expiry(it, now, policy_.default_ttl());
      return true;
    });
    if (expired)
      expirations_.fetch_add(1, std::memory_order_relaxed);
    if (!item.has_value()) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      if (err)
        *err = make_error(ErrorCode::CacheMiss, op::kGet, key);
      return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return std::move(item->value);
  }

  bool set(const Context &ctx, const std::string &key, const T &value,
           Duration ttl, Error *err = nullptr) override {
    if (!policy_.validate(key, op::kSet, err) ||
        !ctx.check(op::kSet, key, err))
      return false;

    const auto resolved = policy_.resolve_ttl(ttl);
    Item item{value, TimePoint{}};
    if (resolved.count() > 0)
      item.expires_at = Clock::now() + resolved;

    auto evicted = store_.set(policy_.full_key(key), std::move(item));
    if (evicted.has_value()) {
      evictions_.fetch_add(1, std::memory_order_relaxed);
      logger()->trace("memory cache: evicted {}", *evicted);
    }
    return true;
  }

  bool del(const Context &ctx, const std::vector<std::string> &keys,
           Error *err = nullptr) override {
    if (!ctx.check(op::kDelete, {}, err))
      return false;
    for (const auto &k : keys)
      store_.del(policy_.full_key(k));
    return true;
  }

  std::optional<bool> exists(const Context &ctx, const std::string &key,
                             Error *err = nullptr) override {
    if (!policy_.validate(key, op::kExists, err) ||
        !ctx.check(op::kExists, key, err))
      return std::nullopt;
    const auto now = Clock::now();
    bool expired = false;
    const bool found =
        store_.contains_if(policy_.full_key(key), [&](const Item &it) {
          expired = is_expired(it, now);
          return !expired;
        });
    if (expired)
      expirations_.fetch_add(1, std::memory_order_relaxed);
    return found;
  }

  bool clear(const Context &ctx, Error *err = nullptr) override {
    if (!ctx.check(op::kClear, {}, err))
      return false;
    store_.clear();
    return true;
  }

  // Counts entries that expired but were not swept yet.
  std::optional<std::size_t> len(const Context &ctx,
                                 Error *err = nullptr) override {
    if (!ctx.check(op::kLen, {}, err))
      return std::nullopt;
    return store_.len();
  }

  bool close(Error * = nullptr) override {
    stop_sweep();
    return true;
  }

  bool ping(const Context &ctx, Error *err = nullptr) override {
    return ctx.check(op::kPing, {}, err);
  }

  std::optional<std::size_t> delete_by_prefix(const Context &ctx,
                                              const std::string &prefix,
                                              Error *err = nullptr) override {
    if (!ctx.check(op::kDeleteByPrefix, prefix, err))
      return std::nullopt;
    const auto fp = policy_.full_key(prefix);
    return store_.erase_if([&](const std::string &k, const Item &) {
      return k.compare(0, fp.size(), fp) == 0;
    });
  }

  CacheStats stats(const Context &) override {
    CacheStats s;
    s.backend = "memory";
    s.items = store_.len();
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.hit_rate = hit_rate(s.hits, s.misses);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.expirations = expirations_.load(std::memory_order_relaxed);
    s.uptime = std::chrono::duration_cast<Duration>(Clock::now() - started_);
    s.refresh_ttl_on_hit = refresh_on_hit_;
    return s;
  }

  std::optional<bool> try_lock(const Context &ctx, const std::string &key,
                               Duration ttl, Error *err = nullptr) override {
    if (!policy_.validate(key, op::kTryLock, err) ||
        !ctx.check(op::kTryLock, key, err))
      return std::nullopt;
    const auto now = Clock::now();
    std::lock_guard lock(locks_mutex_);
    auto [it, inserted] = locks_.try_emplace(lock_key(key));
    if (!inserted && it->second > now)
      return false;
    it->second = now + policy_.resolve_ttl(ttl);
    return true;
  }

  bool unlock(const Context &ctx, const std::string &key,
              Error *err = nullptr) override {
    if (!policy_.validate(key, op::kUnlock, err) ||
        !ctx.check(op::kUnlock, key, err))
      return false;
    std::lock_guard lock(locks_mutex_);
    auto it = locks_.find(lock_key(key));
    if (it == locks_.end()) {
      if (err)
        *err = make_error(ErrorCode::LockNotHeld, op::kUnlock, key);
      return false;
    }
    locks_.erase(it);
    return true;
  }

  // Pushes the expiry of a live entry to at least now + ttl. Returns
  // whether the expiry moved; a missing key reports CacheMiss.
  std::optional<bool> extend_ttl(const Context &ctx, const std::string &key,
                                 Duration ttl, Error *err = nullptr) {
    if (!policy_.validate(key, op::kExists, err) ||
        !ctx.check(op::kExists, key, err))
      return std::nullopt;
    const auto now = Clock::now();
    bool moved = false;
    bool expired = false;
    auto item = store_.get_if(policy_.full_key(key), [&](Item &it) {
      if (is_expired(it, now)) {
        expired = true;
        return false;
      }
      moved = extend_expiry(it, now, ttl);
      return true;
    });
    if (expired)
      expirations_.fetch_add(1, std::memory_order_relaxed);
    if (!item.has_value()) {
      if (err)
        *err = make_error(ErrorCode::CacheMiss, op::kExists, key);
      return std::nullopt;
    }
    return moved;
  }

  // One pass of the background sweep. Returns the number of entries
  // removed.
  std::size_t purge_expired() {
    const auto now = Clock::now();
    const auto removed = store_.erase_if(
        [&](const std::string &, const Item &it) {
          return is_expired(it, now);
        });
    expirations_.fetch_add(removed, std::memory_order_relaxed);
    {
      std::lock_guard lock(locks_mutex_);
      std::erase_if(locks_,
                    [&](const auto &kv) { return kv.second <= now; });
    }
    return removed;
  }

  // Resident keys, most recently used first, namespaced.
  std::vector<std::string> keys() const { return store_.keys(); }

  const KeyPolicy &key_policy() const { return policy_; }

private:
  struct Item {
    T value;
    TimePoint expires_at{}; // epoch = never expires
  };

  static bool is_expired(const Item &it, TimePoint now) {
    return it.expires_at != TimePoint{} && it.expires_at <= now;
  }

  // Expiry only ever moves later; entries without expiry stay that way.
  static bool extend_expiry(Item &it, TimePoint now, Duration ttl) {
    if (ttl.count() <= 0 || it.expires_at == TimePoint{} ||
        it.expires_at >= now + ttl)
      return false;
    it.expires_at = now + ttl;
    return true;
  }

  std::string lock_key(const std::string &key) const {
    return policy_.full_key("lock:" + key);
  }

  void sweep_loop() {
    std::unique_lock lock(sweep_mutex_);
    while (!sweep_cv_.wait_for(lock, sweep_interval_,
                               [this] { return stop_sweep_; })) {
      lock.unlock();
      const auto removed = purge_expired();
      if (removed > 0)
        logger()->debug("memory cache: sweep removed {} expired entries",
                        removed);
      lock.lock();
    }
  }

  void stop_sweep() {
    {
      std::lock_guard lock(sweep_mutex_);
      stop_sweep_ = true;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable())
      sweeper_.join();
  }

  KeyPolicy policy_;
  LruStore<std::string, Item> store_;
  const bool refresh_on_hit_;
  const Duration sweep_interval_;
  const TimePoint started_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> expirations_{0};

  std::mutex locks_mutex_;
  std::unordered_map<std::string, TimePoint> locks_;

  std::mutex sweep_mutex_;
  std::condition_variable sweep_cv_;
  bool stop_sweep_{false};
  std::thread sweeper_;
};

} // namespace cachekit
