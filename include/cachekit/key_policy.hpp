#pragma once

#include "cachekit/error.hpp"
#include "cachekit/types.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace cachekit {

// Key validation, namespacing and TTL resolution shared by every backend.
class KeyPolicy {
public:
  KeyPolicy(std::string prefix, Duration default_ttl)
      : prefix_(std::move(prefix)), default_ttl_(default_ttl) {}

  // A key is blank when it is empty or only whitespace.
  bool validate(const std::string &key, std::string_view op,
                Error *err = nullptr) const;

  std::string full_key(const std::string &key) const {
    return prefix_.empty() ? key : prefix_ + key;
  }

  // Positive override wins, otherwise the configured default.
  Duration resolve_ttl(Duration ttl) const {
    return ttl.count() > 0 ? ttl : default_ttl_;
  }

  const std::string &prefix() const { return prefix_; }
  Duration default_ttl() const { return default_ttl_; }

private:
  std::string prefix_;
  Duration default_ttl_;
};

bool is_blank_key(const std::string &key);

// Joins non-empty parts onto prefix with ':'. Does not apply the cache
// prefix.
std::string make_key(const std::string &prefix,
                     std::initializer_list<std::string_view> parts);

} // namespace cachekit
