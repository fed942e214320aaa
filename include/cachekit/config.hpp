#pragma once

#include "cachekit/error.hpp"
#include "cachekit/types.hpp"

#include <cstddef>
#include <string>

namespace cachekit {

inline constexpr const char *kTypeMemory = "memory";
inline constexpr const char *kTypeRedis = "redis";

inline constexpr const char *kEvictLru = "lru";

struct CacheConfig {
  std::string type{kTypeMemory};
  Duration ttl{std::chrono::minutes(5)};
  std::string prefix{"cache:"};
  bool refresh_ttl_on_hit{false};

  // memory backend
  std::size_t max_entries{10000};
  Duration cleanup_interval{std::chrono::minutes(1)};
  std::string eviction_policy{kEvictLru};

  // remote backend
  std::string remote_url{"redis://127.0.0.1:6379"};
  std::size_t pool_size{10};
  std::size_t max_retries{3};
  Duration conn_timeout{std::chrono::seconds(5)};
  Duration read_timeout{std::chrono::seconds(3)};
  Duration write_timeout{std::chrono::seconds(3)};

  // advanced layer
  std::size_t pipeline_concurrency{10};
  Duration lock_lease{std::chrono::seconds(30)};
  bool metrics_enabled{true};

  std::string log_level{"info"};
};

// Policy identifiers accepted by configuration. Only "lru" is
// implemented by the memory engine.
bool is_known_eviction_policy(const std::string &name);

bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err = nullptr);
void apply_env_overrides(CacheConfig &cfg);
void normalize(CacheConfig &cfg);
bool validate(const CacheConfig &cfg, Error *err = nullptr);

} // namespace cachekit
