#pragma once

#include "cachekit/cache.hpp"
#include "cachekit/config.hpp"
#include "cachekit/key_policy.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/resp_client.hpp"
#include "cachekit/serializer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cachekit {

inline constexpr std::size_t kScanBatch = 1000;

// Cache<T> backed by a Redis-protocol server. Keys are namespaced with the
// configured prefix, values go through a Serializer<T>, and Clear/Len only
// touch keys under the prefix.
template <typename T>
class RespStore final : public Cache<T>,
                        public PipelineGetter<T>,
                        public PipelineSetter<T>,
                        public PrefixDeleter,
                        public StatProvider,
                        public DistributedLocker {
  struct Token {
    explicit Token() = default;
  };

public:
  RespStore(Token, const CacheConfig &cfg, std::unique_ptr<RespClient> client,
            std::unique_ptr<Serializer<T>> serializer)
      : policy_(cfg.prefix, cfg.ttl), client_(std::move(client)),
        serializer_(std::move(serializer)),
        refresh_ttl_on_hit_(cfg.refresh_ttl_on_hit), started_(Clock::now()) {}

  // Null plus InvalidConfig for a bad url or missing serializer, or plus
  // Connection when the initial PING fails.
  static std::unique_ptr<RespStore>
  create(const CacheConfig &cfg, Error *err = nullptr,
         std::unique_ptr<Serializer<T>> serializer = nullptr) {
    if (!serializer) {
      if constexpr (has_default_serializer_v<T>) {
        serializer = default_serializer<T>();
      } else {
        if (err)
          *err = make_error(ErrorCode::InvalidConfig, op::kInit, {},
                            "no serializer for value type");
        return nullptr;
      }
    }
    RespClientOptions opts;
    std::string url_err;
    if (!parse_remote_url(cfg.remote_url, opts.endpoint, &url_err)) {
      if (err)
        *err = make_error(ErrorCode::InvalidConfig, op::kInit, {}, url_err);
      return nullptr;
    }
    opts.pool_size = cfg.pool_size;
    opts.max_retries = cfg.max_retries;
    opts.conn_timeout = cfg.conn_timeout;
    opts.read_timeout = cfg.read_timeout;
    opts.write_timeout = cfg.write_timeout;

    const auto timeout = cfg.conn_timeout.count() > 0
                             ? cfg.conn_timeout
                             : Duration(std::chrono::seconds(5));
    auto client = RespClient::connect(
        opts, Context::background().with_timeout(timeout), err);
    if (!client)
      return nullptr;
    logger()->info("remote cache connected: {}:{} prefix='{}' pool={}",
                   opts.endpoint.host, opts.endpoint.port, cfg.prefix,
                   opts.pool_size);
    return std::make_unique<RespStore>(Token{}, cfg, std::move(client),
                                       std::move(serializer));
  }

  std::optional<T> get(const Context &ctx, const std::string &key,
                       Error *err = nullptr) override {
    if (!policy_.validate(key, op::kGet, err) ||
        !ctx.check(op::kGet, key, err))
      return std::nullopt;
    std::vector<RespCommand> cmds{{"GET", policy_.full_key(key)}};
    if (refresh_ttl_on_hit_ && policy_.default_ttl().count() > 0)
      cmds.push_back({"PEXPIRE", policy_.full_key(key),
                      std::to_string(policy_.default_ttl().count()), "GT"});
    auto replies = client_->pipeline(ctx, cmds, op::kGet, key, err);
    if (!replies || !check_reply(replies->front(), op::kGet, key, err))
      return std::nullopt;
    const auto *reply = &replies->front();
    if (reply->is_null()) {
      misses_.fetch_add(1, std::memory_order_relaxed);
      if (err)
        *err = make_error(ErrorCode::CacheMiss, op::kGet, key);
      return std::nullopt;
    }
    auto v = decode(reply->str, op::kGet, key, err);
    if (v)
      hits_.fetch_add(1, std::memory_order_relaxed);
    return v;
  }

  bool set(const Context &ctx, const std::string &key, const T &value,
           Duration ttl, Error *err = nullptr) override {
    if (!policy_.validate(key, op::kSet, err) ||
        !ctx.check(op::kSet, key, err))
      return false;
    RespCommand cmd;
    if (!set_command(key, value, ttl, cmd, op::kSet, err))
      return false;
    auto reply = client_->command(ctx, cmd, op::kSet, key, err);
    return reply && check_reply(*reply, op::kSet, key, err);
  }

  bool del(const Context &ctx, const std::vector<std::string> &keys,
           Error *err = nullptr) override {
    if (!ctx.check(op::kDelete, {}, err))
      return false;
    if (keys.empty())
      return true;
    RespCommand cmd{"DEL"};
    for (const auto &k : keys)
      cmd.push_back(policy_.full_key(k));
    auto reply = client_->command(ctx, cmd, op::kDelete, {}, err);
    return reply && check_reply(*reply, op::kDelete, {}, err);
  }

  std::optional<bool> exists(const Context &ctx, const std::string &key,
                             Error *err = nullptr) override {
    if (!policy_.validate(key, op::kExists, err) ||
        !ctx.check(op::kExists, key, err))
      return std::nullopt;
    auto reply = client_->command(ctx, {"EXISTS", policy_.full_key(key)},
                                  op::kExists, key, err);
    if (!reply || !check_reply(*reply, op::kExists, key, err))
      return std::nullopt;
    return reply->integer > 0;
  }

  bool clear(const Context &ctx, Error *err = nullptr) override {
    if (!ctx.check(op::kClear, {}, err))
      return false;
    return delete_matching(ctx, escape_glob(policy_.prefix()) + "*",
                           op::kClear, {}, err)
        .has_value();
  }

  std::optional<std::size_t> len(const Context &ctx,
                                 Error *err = nullptr) override {
    if (!ctx.check(op::kLen, {}, err))
      return std::nullopt;
    std::size_t total = 0;
    const bool ok = scan(ctx, escape_glob(policy_.prefix()) + "*", op::kLen,
                         {}, err, [&total](std::vector<std::string> keys) {
                           total += keys.size();
                           return true;
                         });
    if (!ok)
      return std::nullopt;
    return total;
  }

  bool close(Error * = nullptr) override {
    client_->close();
    return true;
  }

  bool ping(const Context &ctx, Error *err = nullptr) override {
    if (!ctx.check(op::kPing, {}, err))
      return false;
    auto reply = client_->command(ctx, {"PING"}, op::kPing, {}, err);
    return reply && check_reply(*reply, op::kPing, {}, err);
  }

  std::optional<ValueMap<T>>
  get_many_pipeline(const Context &ctx, const std::vector<std::string> &keys,
                    Error *err = nullptr) override {
    if (keys.empty())
      return ValueMap<T>{};
    if (!ctx.check(op::kGetManyPipeline, {}, err))
      return std::nullopt;
    std::vector<RespCommand> cmds;
    cmds.reserve(keys.size());
    for (const auto &k : keys) {
      if (!policy_.validate(k, op::kGetManyPipeline, err))
        return std::nullopt;
      cmds.push_back({"GET", policy_.full_key(k)});
    }
    auto replies = client_->pipeline(ctx, cmds, op::kGetManyPipeline, {}, err);
    if (!replies)
      return std::nullopt;
    ValueMap<T> out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
      const auto &r = (*replies)[i];
      if (r.is_null()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        continue;
      }
      if (!check_reply(r, op::kGetManyPipeline, keys[i], err))
        return std::nullopt;
      auto v = decode(r.str, op::kGetManyPipeline, keys[i], err);
      if (!v)
        return std::nullopt;
      hits_.fetch_add(1, std::memory_order_relaxed);
      out.insert_or_assign(keys[i], std::move(*v));
    }
    return out;
  }

  bool set_many_pipeline(const Context &ctx, const ValueMap<T> &items,
                         Duration ttl, Error *err = nullptr) override {
    if (items.empty())
      return true;
    if (!ctx.check(op::kSetManyPipeline, {}, err))
      return false;
    std::vector<RespCommand> cmds;
    std::vector<const std::string *> keys;
    cmds.reserve(items.size());
    keys.reserve(items.size());
    for (const auto &item : items) {
      if (!policy_.validate(item.first, op::kSetManyPipeline, err))
        return false;
      RespCommand cmd;
      if (!set_command(item.first, item.second, ttl, cmd,
                       op::kSetManyPipeline, err))
        return false;
      cmds.push_back(std::move(cmd));
      keys.push_back(&item.first);
    }
    auto replies = client_->pipeline(ctx, cmds, op::kSetManyPipeline, {}, err);
    if (!replies)
      return false;
    for (std::size_t i = 0; i < replies->size(); ++i)
      if (!check_reply((*replies)[i], op::kSetManyPipeline, *keys[i], err))
        return false;
    return true;
  }

  std::optional<std::size_t> delete_by_prefix(const Context &ctx,
                                              const std::string &prefix,
                                              Error *err = nullptr) override {
    if (!ctx.check(op::kDeleteByPrefix, prefix, err))
      return std::nullopt;
    return delete_matching(ctx, escape_glob(policy_.full_key(prefix)) + "*",
                           op::kDeleteByPrefix, prefix, err);
  }

  CacheStats stats(const Context &ctx) override {
    CacheStats s;
    s.backend = kTypeRedis;
    if (auto n = len(ctx))
      s.items = *n;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.hit_rate = hit_rate(s.hits, s.misses);
    s.uptime = std::chrono::duration_cast<Duration>(Clock::now() - started_);
    s.refresh_ttl_on_hit = refresh_ttl_on_hit_;
    return s;
  }

  std::optional<bool> try_lock(const Context &ctx, const std::string &key,
                               Duration ttl, Error *err = nullptr) override {
    if (!policy_.validate(key, op::kTryLock, err) ||
        !ctx.check(op::kTryLock, key, err))
      return std::nullopt;
    const auto lease = policy_.resolve_ttl(ttl);
    auto reply = client_->command(ctx,
                                  {"SET", lock_key(key), "1", "NX", "PX",
                                   std::to_string(lease.count())},
                                  op::kLock, key, err);
    if (!reply || !check_reply(*reply, op::kLock, key, err))
      return std::nullopt;
    return !reply->is_null();
  }

  bool unlock(const Context &ctx, const std::string &key,
              Error *err = nullptr) override {
    if (!policy_.validate(key, op::kUnlock, err) ||
        !ctx.check(op::kUnlock, key, err))
      return false;
    auto reply =
        client_->command(ctx, {"DEL", lock_key(key)}, op::kUnlock, key, err);
    if (!reply || !check_reply(*reply, op::kUnlock, key, err))
      return false;
    if (reply->integer == 0) {
      if (err)
        *err = make_error(ErrorCode::LockNotHeld, op::kUnlock, key);
      return false;
    }
    return true;
  }

  const KeyPolicy &key_policy() const { return policy_; }
  RespClient &client() { return *client_; }

private:
  using KeyBatchFn = std::function<bool(std::vector<std::string> keys)>;

  std::string lock_key(const std::string &key) const {
    return policy_.full_key("lock:" + key);
  }

  bool set_command(const std::string &key, const T &value, Duration ttl,
                   RespCommand &cmd, std::string_view op, Error *err) const {
    std::string data;
    Error e;
    if (!serializer_->encode(value, data, &e)) {
      if (err)
        *err = make_error(ErrorCode::Serialize, op, key, e.detail);
      return false;
    }
    cmd = {"SET", policy_.full_key(key), std::move(data)};
    const auto resolved = policy_.resolve_ttl(ttl);
    if (resolved.count() > 0) {
      cmd.push_back("PX");
      cmd.push_back(std::to_string(resolved.count()));
    }
    return true;
  }

  std::optional<T> decode(const std::string &data, std::string_view op,
                          const std::string &key, Error *err) const {
    Error e;
    auto v = serializer_->decode(data, &e);
    if (!v && err)
      *err = make_error(ErrorCode::Deserialize, op, key, e.detail);
    return v;
  }

  static bool check_reply(const RespReply &reply, std::string_view op,
                          const std::string &key, Error *err) {
    if (!reply.is_error())
      return true;
    if (err)
      *err = make_error(ErrorCode::Protocol, op, key, reply.str);
    return false;
  }

  // Walks SCAN cursors over pattern, handing each non-empty batch to fn.
  bool scan(const Context &ctx, const std::string &pattern,
            std::string_view op, const std::string &key, Error *err,
            const KeyBatchFn &fn) {
    std::string cursor = "0";
    do {
      if (!ctx.check(op, key, err))
        return false;
      auto reply = client_->command(ctx,
                                    {"SCAN", cursor, "MATCH", pattern, "COUNT",
                                     std::to_string(kScanBatch)},
                                    op, key, err);
      if (!reply || !check_reply(*reply, op, key, err))
        return false;
      if (reply->type != RespReply::Type::Array ||
          reply->elements.size() != 2 ||
          reply->elements[1].type != RespReply::Type::Array) {
        if (err)
          *err = make_error(ErrorCode::Protocol, op, key,
                            "unexpected SCAN reply");
        return false;
      }
      cursor = reply->elements[0].str;
      std::vector<std::string> keys;
      keys.reserve(reply->elements[1].elements.size());
      for (auto &k : reply->elements[1].elements)
        keys.push_back(std::move(k.str));
      if (!keys.empty() && !fn(std::move(keys)))
        return false;
    } while (cursor != "0");
    return true;
  }

  std::optional<std::size_t> delete_matching(const Context &ctx,
                                             const std::string &pattern,
                                             std::string_view op,
                                             const std::string &key,
                                             Error *err) {
    std::size_t removed = 0;
    const bool ok =
        scan(ctx, pattern, op, key, err,
             [&](std::vector<std::string> keys) {
               RespCommand cmd{"DEL"};
               cmd.insert(cmd.end(), std::make_move_iterator(keys.begin()),
                          std::make_move_iterator(keys.end()));
               auto reply = client_->command(ctx, cmd, op, key, err);
               if (!reply || !check_reply(*reply, op, key, err))
                 return false;
               removed += static_cast<std::size_t>(reply->integer);
               return true;
             });
    if (!ok)
      return std::nullopt;
    return removed;
  }

  KeyPolicy policy_;
  std::unique_ptr<RespClient> client_;
  std::unique_ptr<Serializer<T>> serializer_;
  const bool refresh_ttl_on_hit_;
  const TimePoint started_;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
};

} // namespace cachekit
