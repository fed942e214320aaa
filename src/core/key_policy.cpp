#include "cachekit/key_policy.hpp"

#include <algorithm>
#include <cctype>

namespace cachekit {

bool is_blank_key(const std::string &key) {
  return std::all_of(key.begin(), key.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

bool KeyPolicy::validate(const std::string &key, std::string_view op,
                         Error *err) const {
  if (!is_blank_key(key))
    return true;
  if (err)
    *err = make_error(ErrorCode::KeyEmpty, op);
  return false;
}

std::string make_key(const std::string &prefix,
                     std::initializer_list<std::string_view> parts) {
  std::string out = prefix;
  for (auto p : parts) {
    if (p.empty())
      continue;
    if (!out.empty())
      out += ':';
    out += p;
  }
  return out;
}

} // namespace cachekit
