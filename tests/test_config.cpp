#include "cachekit/config.hpp"
#include "cachekit/context.hpp"
#include "cachekit/factory.hpp"
#include "cachekit/key_policy.hpp"
#include "cachekit/resp_client.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace cachekit;
using namespace std::chrono_literals;

TEST_CASE("config defaults", "[config]") {
  CacheConfig cfg;
  CHECK(cfg.type == "memory");
  CHECK(cfg.ttl == 5min);
  CHECK(cfg.prefix == "cache:");
  CHECK_FALSE(cfg.refresh_ttl_on_hit);
  CHECK(cfg.max_entries == 10000);
  CHECK(cfg.cleanup_interval == 1min);
  CHECK(cfg.eviction_policy == "lru");
  CHECK(cfg.pool_size == 10);
  CHECK(cfg.pipeline_concurrency == 10);
  CHECK(cfg.lock_lease == 30s);
  CHECK(validate(cfg));
}

TEST_CASE("parse_config reads every field", "[config]") {
  CacheConfig cfg;
  std::string err;
  REQUIRE(parse_config(R"({
    "type": "redis",
    "ttl_ms": 2500,
    "prefix": "app:",
    "refresh_on_hit": true,
    "max_entries": 64,
    "cleanup_interval_ms": 250,
    "eviction_policy": "lru",
    "remote_url": "redis://cache.local:6380/2",
    "pool_size": 4,
    "max_retries": 1,
    "conn_timeout_ms": 700,
    "read_timeout_ms": 800,
    "write_timeout_ms": 900,
    "pipeline_concurrency": 3,
    "lock_lease_ms": 1500,
    "metrics_enabled": false,
    "log_level": "debug"
  })",
                       cfg, &err));
  CHECK(err.empty());
  CHECK(cfg.type == "redis");
  CHECK(cfg.ttl == 2500ms);
  CHECK(cfg.prefix == "app:");
  CHECK(cfg.refresh_ttl_on_hit);
  CHECK(cfg.max_entries == 64);
  CHECK(cfg.cleanup_interval == 250ms);
  CHECK(cfg.remote_url == "redis://cache.local:6380/2");
  CHECK(cfg.pool_size == 4);
  CHECK(cfg.max_retries == 1);
  CHECK(cfg.conn_timeout == 700ms);
  CHECK(cfg.read_timeout == 800ms);
  CHECK(cfg.write_timeout == 900ms);
  CHECK(cfg.pipeline_concurrency == 3);
  CHECK(cfg.lock_lease == 1500ms);
  CHECK_FALSE(cfg.metrics_enabled);
  CHECK(cfg.log_level == "debug");
}

TEST_CASE("parse_config keeps unspecified fields", "[config]") {
  CacheConfig cfg;
  cfg.prefix = "kept:";
  REQUIRE(parse_config(R"({"ttl_ms": 10})", cfg));
  CHECK(cfg.ttl == 10ms);
  CHECK(cfg.prefix == "kept:");
}

TEST_CASE("parse_config rejects non-object input untouched", "[config]") {
  CacheConfig cfg;
  cfg.prefix = "before:";
  std::string err;
  CHECK_FALSE(parse_config(R"("prefix": "after:")", cfg, &err));
  CHECK(err == "invalid schema");
  CHECK(cfg.prefix == "before:");
}

TEST_CASE("load_config reports a missing file", "[config]") {
  CacheConfig cfg;
  std::string err;
  CHECK_FALSE(load_config("/nonexistent/cachekit.json", cfg, &err));
  CHECK(err.find("config file not found") != std::string::npos);
}

TEST_CASE("load_config reads a file", "[config]") {
  const std::string path = "cachekit_test_config.json";
  {
    std::ofstream out(path);
    out << R"({"max_entries": 12, "prefix": "file:"})";
  }
  CacheConfig cfg;
  REQUIRE(load_config(path, cfg));
  CHECK(cfg.max_entries == 12);
  CHECK(cfg.prefix == "file:");
  std::remove(path.c_str());
}

TEST_CASE("environment overrides config", "[config]") {
  ::setenv("CACHEKIT_TYPE", "REDIS", 1);
  ::setenv("CACHEKIT_PREFIX", "env:", 1);
  ::setenv("CACHEKIT_TTL_MS", "1234", 1);
  ::setenv("CACHEKIT_REMOTE_URL", "redis://10.0.0.1:7000", 1);
  CacheConfig cfg;
  apply_env_overrides(cfg);
  CHECK(cfg.type == "redis");
  CHECK(cfg.prefix == "env:");
  CHECK(cfg.ttl == 1234ms);
  CHECK(cfg.remote_url == "redis://10.0.0.1:7000");

  ::setenv("CACHEKIT_TTL_MS", "0", 1);
  CacheConfig untouched;
  apply_env_overrides(untouched);
  CHECK(untouched.ttl == 5min);

  ::unsetenv("CACHEKIT_TYPE");
  ::unsetenv("CACHEKIT_PREFIX");
  ::unsetenv("CACHEKIT_TTL_MS");
  ::unsetenv("CACHEKIT_REMOTE_URL");
}

TEST_CASE("normalize canonicalizes fields", "[config]") {
  CacheConfig cfg;
  cfg.type = "Memory";
  cfg.prefix = "  app:  ";
  cfg.eviction_policy = "";
  cfg.cleanup_interval = Duration(0);
  normalize(cfg);
  CHECK(cfg.type == "memory");
  CHECK(cfg.prefix == "app:");
  CHECK(cfg.eviction_policy == "lru");
  CHECK(cfg.cleanup_interval == 1min);
}

TEST_CASE("validate rejects bad configuration", "[config]") {
  Error err;
  CacheConfig cfg;

  SECTION("unknown type") {
    cfg.type = "disk";
    CHECK_FALSE(validate(cfg, &err));
    CHECK(err.detail.find("disk") != std::string::npos);
  }
  SECTION("non-positive ttl") {
    cfg.ttl = Duration(0);
    CHECK_FALSE(validate(cfg, &err));
  }
  SECTION("memory without capacity") {
    cfg.max_entries = 0;
    CHECK_FALSE(validate(cfg, &err));
  }
  SECTION("unknown eviction policy") {
    cfg.eviction_policy = "random";
    CHECK_FALSE(validate(cfg, &err));
  }
  SECTION("redis without url") {
    cfg.type = "redis";
    cfg.remote_url.clear();
    CHECK_FALSE(validate(cfg, &err));
  }
  SECTION("redis without pool") {
    cfg.type = "redis";
    cfg.pool_size = 0;
    CHECK_FALSE(validate(cfg, &err));
  }
  SECTION("redis without connect timeout") {
    cfg.type = "redis";
    cfg.conn_timeout = Duration(0);
    CHECK_FALSE(validate(cfg, &err));
  }
  CHECK(err.code == ErrorCode::InvalidConfig);
  CHECK(err.op == "init");
}

TEST_CASE("validate accepts known but unimplemented policies", "[config]") {
  CacheConfig cfg;
  cfg.eviction_policy = "lfu";
  CHECK(validate(cfg));
  CHECK(is_known_eviction_policy("tinylfu"));
  CHECK_FALSE(is_known_eviction_policy("mru"));
}

TEST_CASE("make_cache builds a memory backend", "[config][factory]") {
  CacheConfig cfg;
  cfg.type = "MEMORY";
  cfg.max_entries = 4;
  Error err;
  auto c = make_cache<std::string>(cfg, &err);
  REQUIRE(c);
  const auto ctx = Context::background();
  REQUIRE(c->set(ctx, "k", "v", Duration(0)));
  CHECK(c->get(ctx, "k") == std::optional<std::string>("v"));
  CHECK(c->close());
}

TEST_CASE("make_cache rejects invalid configuration", "[config][factory]") {
  Error err;

  SECTION("bad type") {
    CacheConfig cfg;
    cfg.type = "disk";
    CHECK_FALSE(make_cache<std::string>(cfg, &err));
  }
  SECTION("unimplemented policy") {
    CacheConfig cfg;
    cfg.eviction_policy = "fifo";
    CHECK_FALSE(make_cache<std::string>(cfg, &err));
  }
  CHECK(err.code == ErrorCode::InvalidConfig);
}

TEST_CASE("parse_remote_url", "[config][url]") {
  Endpoint ep;
  std::string err;

  REQUIRE(parse_remote_url("redis://:secret@cache.local:6380/3", ep, &err));
  CHECK(ep.host == "cache.local");
  CHECK(ep.port == 6380);
  CHECK(ep.db == 3);
  CHECK(ep.password == "secret");

  REQUIRE(parse_remote_url("tcp://10.1.2.3", ep));
  CHECK(ep.host == "10.1.2.3");
  CHECK(ep.port == 6379);
  CHECK(ep.db == 0);
  CHECK(ep.password.empty());

  REQUIRE(parse_remote_url("localhost:7000", ep));
  CHECK(ep.host == "localhost");
  CHECK(ep.port == 7000);

  CHECK_FALSE(parse_remote_url("http://example.com", ep, &err));
  CHECK(err.find("scheme") != std::string::npos);
  CHECK_FALSE(parse_remote_url("redis://host:99999", ep));
  CHECK_FALSE(parse_remote_url("redis://host:6379/x", ep));
}

TEST_CASE("key helpers", "[config][keys]") {
  CHECK(is_blank_key(""));
  CHECK(is_blank_key(" \t"));
  CHECK_FALSE(is_blank_key(" a "));
  CHECK(make_key("user", {"42", "", "profile"}) == "user:42:profile");
  CHECK(make_key("", {"a", "b"}) == "a:b");

  KeyPolicy policy("svc:", 10s);
  CHECK(policy.full_key("k") == "svc:k");
  CHECK(policy.resolve_ttl(Duration(0)) == 10s);
  CHECK(policy.resolve_ttl(Duration(-5)) == 10s);
  CHECK(policy.resolve_ttl(250ms) == 250ms);
  Error err;
  CHECK_FALSE(policy.validate("", "set", &err));
  CHECK(err.code == ErrorCode::KeyEmpty);
  CHECK(err.op == "set");
}

TEST_CASE("error messages and classification", "[config][errors]") {
  auto e = make_error(ErrorCode::CacheMiss, "get", "user:1");
  CHECK(e.message() == "get [user:1]: cache miss");
  CHECK(is_cache_miss(e));
  CHECK_FALSE(is_retryable(e));

  e = make_error(ErrorCode::Connection, {}, {}, "refused");
  CHECK(e.message() == "cache: connection failed: refused");
  CHECK(is_retryable(e));

  CHECK(is_lock_error(make_error(ErrorCode::LockNotHeld, "unlock")));
  CHECK(is_serialization_error(make_error(ErrorCode::Deserialize, "get")));
  CHECK(is_context_error(make_error(ErrorCode::DeadlineExceeded, "get")));
  CHECK(std::string(error_code_name(ErrorCode::ComputeFailed)) ==
        "compute_failed");
  CHECK(Error{}.ok());
}

TEST_CASE("context cancellation propagates to children", "[config][context]") {
  auto parent = Context::background().with_cancel();
  auto child = parent.with_timeout(10s);
  CHECK_FALSE(child.done());
  REQUIRE(child.deadline().has_value());
  CHECK_FALSE(Context::background().deadline().has_value());

  parent.cancel();
  CHECK(child.err() == ErrorCode::Canceled);
  Error err;
  CHECK_FALSE(child.check("get", "k", &err));
  CHECK(err.code == ErrorCode::Canceled);
  CHECK(err.key == "k");

  Context::background().cancel();
  CHECK_FALSE(Context::background().done());
}

TEST_CASE("context deadline expires", "[config][context]") {
  auto outer = Context::background().with_timeout(20ms);
  auto inner = outer.with_timeout(10s);
  CHECK(*inner.deadline() == *outer.deadline());
  std::this_thread::sleep_for(50ms);
  CHECK(inner.err() == ErrorCode::DeadlineExceeded);
}
