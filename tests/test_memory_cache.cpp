#include "cachekit/memory_cache.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace cachekit;
using namespace std::chrono_literals;

namespace {
CacheConfig memory_config(std::size_t max_entries = 100) {
  CacheConfig cfg;
  cfg.max_entries = max_entries;
  cfg.prefix = "test:";
  cfg.cleanup_interval = Duration(0);
  return cfg;
}

std::unique_ptr<MemoryCache<std::string>>
make_memory(const CacheConfig &cfg) {
  Error err;
  auto c = MemoryCache<std::string>::create(cfg, &err);
  REQUIRE(c);
  return c;
}
} // namespace

TEST_CASE("memory cache read-your-write", "[memory]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "k", "v", Duration(0)));
  auto v = c->get(ctx, "k");
  REQUIRE(v.has_value());
  CHECK(*v == "v");
  CHECK(c->exists(ctx, "k") == true);
  CHECK(c->len(ctx) == 1u);
}

TEST_CASE("memory cache misses report CacheMiss with the key", "[memory]") {
  auto c = make_memory(memory_config());
  Error err;
  CHECK_FALSE(c->get(Context::background(), "absent", &err).has_value());
  CHECK(err.code == ErrorCode::CacheMiss);
  CHECK(err.op == "get");
  CHECK(err.key == "absent");
  CHECK(is_cache_miss(err));
}

TEST_CASE("memory cache rejects blank keys", "[memory]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  Error err;
  CHECK_FALSE(c->set(ctx, "", "v", Duration(0), &err));
  CHECK(err.code == ErrorCode::KeyEmpty);
  err = {};
  CHECK_FALSE(c->get(ctx, "   ", &err).has_value());
  CHECK(err.code == ErrorCode::KeyEmpty);
}

TEST_CASE("memory cache honours canceled contexts", "[memory]") {
  auto c = make_memory(memory_config());
  auto ctx = Context::background().with_cancel();
  ctx.cancel();
  Error err;
  CHECK_FALSE(c->get(ctx, "k", &err).has_value());
  CHECK(err.code == ErrorCode::Canceled);
  CHECK(is_context_error(err));
  CHECK_FALSE(is_retryable(err));
}

TEST_CASE("memory cache capacity two evicts the oldest", "[memory]") {
  auto c = make_memory(memory_config(2));
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "A", "1", Duration(0)));
  REQUIRE(c->set(ctx, "B", "2", Duration(0)));
  REQUIRE(c->set(ctx, "C", "3", Duration(0)));

  Error err;
  CHECK_FALSE(c->get(ctx, "A", &err).has_value());
  CHECK(err.code == ErrorCode::CacheMiss);
  CHECK(c->get(ctx, "B") == std::optional<std::string>("2"));
  CHECK(c->get(ctx, "C") == std::optional<std::string>("3"));
  CHECK(c->stats(ctx).evictions == 1);
}

TEST_CASE("memory cache access protects entries from eviction", "[memory]") {
  auto c = make_memory(memory_config(3));
  const auto ctx = Context::background();
  for (const auto *k : {"a", "b", "c"})
    REQUIRE(c->set(ctx, k, k, Duration(0)));
  REQUIRE(c->get(ctx, "a").has_value());
  REQUIRE(c->set(ctx, "d", "d", Duration(0)));
  CHECK(c->exists(ctx, "a") == true);
  CHECK(c->exists(ctx, "b") == false);
  CHECK(c->len(ctx) == 3u);
}

TEST_CASE("memory cache TTL expires lazily", "[memory][ttl]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "short", "v", 50ms));
  REQUIRE(c->set(ctx, "long", "v", 5s));
  CHECK(c->get(ctx, "short").has_value());

  std::this_thread::sleep_for(120ms);
  Error err;
  CHECK_FALSE(c->get(ctx, "short", &err).has_value());
  CHECK(err.code == ErrorCode::CacheMiss);
  CHECK(c->get(ctx, "long").has_value());
  CHECK(c->stats(ctx).expirations == 1);
}

TEST_CASE("memory cache exists purges expired entries", "[memory][ttl]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "k", "v", 20ms));
  std::this_thread::sleep_for(60ms);
  CHECK(c->len(ctx) == 1u);
  CHECK(c->exists(ctx, "k") == false);
  CHECK(c->len(ctx) == 0u);
}

TEST_CASE("memory cache refresh on hit extends expiry", "[memory][ttl]") {
  auto cfg = memory_config();
  cfg.ttl = 150ms;
  cfg.refresh_ttl_on_hit = true;
  auto c = make_memory(cfg);
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "k", "v", Duration(0)));
  for (int i = 0; i < 4; ++i) {
    std::this_thread::sleep_for(80ms);
    REQUIRE(c->get(ctx, "k").has_value());
  }
  CHECK(c->stats(ctx).refresh_ttl_on_hit);
}

TEST_CASE("memory cache refresh on hit never shortens an explicit ttl",
          "[memory][ttl]") {
  auto cfg = memory_config();
  cfg.ttl = 20ms;
  cfg.refresh_ttl_on_hit = true;
  auto c = make_memory(cfg);
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "long", "v", 5s));
  REQUIRE(c->get(ctx, "long").has_value());
  std::this_thread::sleep_for(60ms);
  CHECK(c->get(ctx, "long").has_value());
}

TEST_CASE("memory cache refresh on hit with no default ttl keeps entries",
          "[memory][ttl]") {
  auto cfg = memory_config();
  cfg.ttl = Duration(0);
  cfg.refresh_ttl_on_hit = true;
  auto c = make_memory(cfg);
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "timed", "v", 60s));
  REQUIRE(c->set(ctx, "forever", "v", Duration(0)));
  REQUIRE(c->get(ctx, "timed").has_value());
  REQUIRE(c->get(ctx, "forever").has_value());
  std::this_thread::sleep_for(5ms);
  CHECK(c->get(ctx, "timed").has_value());
  CHECK(c->get(ctx, "forever").has_value());
}

TEST_CASE("memory cache extend_ttl only moves expiry later", "[memory][ttl]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "k", "v", 50ms));
  CHECK(c->extend_ttl(ctx, "k", 5s) == true);
  CHECK(c->extend_ttl(ctx, "k", 1ms) == false);
  std::this_thread::sleep_for(100ms);
  CHECK(c->get(ctx, "k").has_value());

  Error err;
  CHECK_FALSE(c->extend_ttl(ctx, "absent", 5s, &err).has_value());
  CHECK(err.code == ErrorCode::CacheMiss);
}

TEST_CASE("memory cache background sweep removes expired entries",
          "[memory][ttl]") {
  auto cfg = memory_config();
  cfg.cleanup_interval = 20ms;
  auto c = make_memory(cfg);
  const auto ctx = Context::background();
  for (int i = 0; i < 10; ++i)
    REQUIRE(c->set(ctx, "k" + std::to_string(i), "v", 10ms));
  REQUIRE(c->set(ctx, "stay", "v", 10s));

  const auto deadline = Clock::now() + 2s;
  while (c->len(ctx).value_or(0) > 1 && Clock::now() < deadline)
    std::this_thread::sleep_for(10ms);
  CHECK(c->len(ctx) == 1u);
  CHECK(c->stats(ctx).expirations == 10);
  CHECK(c->close());
}

TEST_CASE("memory cache deletes by prefix", "[memory]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "user:1", "a", Duration(0)));
  REQUIRE(c->set(ctx, "user:2", "b", Duration(0)));
  REQUIRE(c->set(ctx, "order:1", "c", Duration(0)));

  auto removed = c->delete_by_prefix(ctx, "user:");
  REQUIRE(removed.has_value());
  CHECK(*removed == 2);
  CHECK(c->exists(ctx, "user:1") == false);
  CHECK(c->exists(ctx, "user:2") == false);
  CHECK(c->get(ctx, "order:1") == std::optional<std::string>("c"));
}

TEST_CASE("memory cache delete ignores absent keys and clear empties",
          "[memory]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "a", "1", Duration(0)));
  REQUIRE(c->set(ctx, "b", "2", Duration(0)));
  CHECK(c->del(ctx, {"a", "missing"}));
  CHECK(c->len(ctx) == 1u);
  CHECK(c->clear(ctx));
  CHECK(c->len(ctx) == 0u);
}

TEST_CASE("memory cache rejects policies other than LRU", "[memory][config]") {
  auto cfg = memory_config();
  cfg.eviction_policy = "lfu";
  Error err;
  auto c = MemoryCache<std::string>::create(cfg, &err);
  CHECK_FALSE(c);
  CHECK(err.code == ErrorCode::InvalidConfig);

  cfg.eviction_policy.clear();
  CHECK(MemoryCache<std::string>::create(cfg, &err));
}

TEST_CASE("memory cache lease locks are exclusive and expire", "[memory][lock]") {
  auto c = make_memory(memory_config());
  const auto ctx = Context::background();
  CHECK(c->try_lock(ctx, "job", 50ms) == true);
  CHECK(c->try_lock(ctx, "job", 50ms) == false);
  CHECK(c->unlock(ctx, "job"));

  Error err;
  CHECK_FALSE(c->unlock(ctx, "job", &err));
  CHECK(err.code == ErrorCode::LockNotHeld);

  CHECK(c->try_lock(ctx, "lease", 30ms) == true);
  std::this_thread::sleep_for(60ms);
  CHECK(c->try_lock(ctx, "lease", 30ms) == true);
}

TEST_CASE("memory cache works with non-string values", "[memory]") {
  CacheConfig cfg;
  cfg.cleanup_interval = Duration(0);
  auto c = MemoryCache<std::vector<int>>::create(cfg);
  REQUIRE(c);
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "v", std::vector<int>{1, 2, 3}, Duration(0)));
  auto v = c->get(ctx, "v");
  REQUIRE(v.has_value());
  CHECK(v->size() == 3);
}
