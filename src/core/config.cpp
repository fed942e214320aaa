#include "cachekit/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace cachekit {
namespace {
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
bool extract_ms(const std::string &text, const std::string &key,
                Duration &out) {
  std::uint64_t v = 0;
  if (!extract_u64(text, key, v))
    return false;
  out = Duration(static_cast<Duration::rep>(v));
  return true;
}
bool extract_size(const std::string &text, const std::string &key,
                  std::size_t &out) {
  std::uint64_t v = 0;
  if (!extract_u64(text, key, v))
    return false;
  out = static_cast<std::size_t>(v);
  return true;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool fail(Error *err, const std::string &detail) {
  if (err)
    *err = make_error(ErrorCode::InvalidConfig, op::kInit, {}, detail);
  return false;
}
} // namespace

bool is_known_eviction_policy(const std::string &name) {
  return name == "lru" || name == "lfu" || name == "fifo" || name == "arc" ||
         name == "tinylfu";
}

bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), out, err);
}

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig c = out;
  extract_string(text, "type", c.type);
  extract_ms(text, "ttl_ms", c.ttl);
  extract_string(text, "prefix", c.prefix);
  extract_bool(text, "refresh_on_hit", c.refresh_ttl_on_hit);
  extract_size(text, "max_entries", c.max_entries);
  extract_ms(text, "cleanup_interval_ms", c.cleanup_interval);
  extract_string(text, "eviction_policy", c.eviction_policy);
  extract_string(text, "remote_url", c.remote_url);
  extract_size(text, "pool_size", c.pool_size);
  extract_size(text, "max_retries", c.max_retries);
  extract_ms(text, "conn_timeout_ms", c.conn_timeout);
  extract_ms(text, "read_timeout_ms", c.read_timeout);
  extract_ms(text, "write_timeout_ms", c.write_timeout);
  extract_size(text, "pipeline_concurrency", c.pipeline_concurrency);
  extract_ms(text, "lock_lease_ms", c.lock_lease);
  extract_bool(text, "metrics_enabled", c.metrics_enabled);
  extract_string(text, "log_level", c.log_level);

  out = std::move(c);
  return true;
}

void apply_env_overrides(CacheConfig &cfg) {
  if (const char *v = std::getenv("CACHEKIT_TYPE"); v && *v)
    cfg.type = lower(v);
  if (const char *v = std::getenv("CACHEKIT_PREFIX"); v && *v)
    cfg.prefix = v;
  if (const char *v = std::getenv("CACHEKIT_TTL_MS"); v && *v) {
    char *end = nullptr;
    const auto ms = std::strtoull(v, &end, 10);
    if (end != v && *end == '\0' && ms > 0)
      cfg.ttl = Duration(static_cast<Duration::rep>(ms));
  }
  if (const char *v = std::getenv("CACHEKIT_REMOTE_URL"); v && *v)
    cfg.remote_url = v;
}

void normalize(CacheConfig &cfg) {
  cfg.type = lower(cfg.type);
  cfg.prefix = trim(cfg.prefix);
  cfg.eviction_policy = lower(cfg.eviction_policy);
  if (cfg.eviction_policy.empty())
    cfg.eviction_policy = kEvictLru;
  if (cfg.cleanup_interval.count() == 0)
    cfg.cleanup_interval = std::chrono::minutes(1);
}

bool validate(const CacheConfig &cfg, Error *err) {
  if (cfg.type != kTypeMemory && cfg.type != kTypeRedis)
    return fail(err, "invalid cache type: \"" + cfg.type + "\"");
  if (cfg.ttl.count() <= 0)
    return fail(err, "ttl must be > 0");

  if (cfg.type == kTypeMemory) {
    if (cfg.max_entries == 0)
      return fail(err, "max_entries must be set");
    if (!is_known_eviction_policy(cfg.eviction_policy))
      return fail(err,
                  "invalid eviction_policy: \"" + cfg.eviction_policy + "\"");
    return true;
  }

  if (cfg.remote_url.empty())
    return fail(err, "remote_url is required for redis cache");
  if (cfg.pool_size == 0)
    return fail(err, "pool_size must be > 0");
  if (cfg.conn_timeout.count() <= 0)
    return fail(err, "conn_timeout must be > 0");
  return true;
}

} // namespace cachekit
