#pragma once

#include "cachekit/error.hpp"
#include "cachekit/types.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace cachekit {

// Converts values to and from the byte strings a remote store keeps.
// Errors carry Serialize or Deserialize; the store fills in op and key.
template <typename T> class Serializer {
public:
  virtual ~Serializer() = default;
  virtual bool encode(const T &value, std::string &out,
                      Error *err = nullptr) const = 0;
  virtual std::optional<T> decode(std::string_view data,
                                  Error *err = nullptr) const = 0;
};

class StringSerializer final : public Serializer<std::string> {
public:
  bool encode(const std::string &value, std::string &out,
              Error * = nullptr) const override {
    out = value;
    return true;
  }
  std::optional<std::string> decode(std::string_view data,
                                    Error * = nullptr) const override {
    return std::string(data);
  }
};

class BytesSerializer final : public Serializer<Bytes> {
public:
  bool encode(const Bytes &value, std::string &out,
              Error * = nullptr) const override {
    out.assign(value.begin(), value.end());
    return true;
  }
  std::optional<Bytes> decode(std::string_view data,
                              Error * = nullptr) const override {
    return Bytes(data.begin(), data.end());
  }
};

// Decimal text, so values stay readable (and INCR-able) on the server.
template <typename N> class NumberSerializer final : public Serializer<N> {
  static_assert(std::is_arithmetic_v<N>, "NumberSerializer needs a number");

public:
  bool encode(const N &value, std::string &out,
              Error *err = nullptr) const override {
    if constexpr (std::is_floating_point_v<N>) {
      if (!std::isfinite(value)) {
        if (err)
          *err = make_error(ErrorCode::Serialize, {}, {}, "non-finite number");
        return false;
      }
      std::ostringstream os;
      os.precision(std::numeric_limits<N>::max_digits10);
      os << value;
      out = os.str();
    } else {
      out = std::to_string(value);
    }
    return true;
  }

  std::optional<N> decode(std::string_view data,
                          Error *err = nullptr) const override {
    if constexpr (std::is_same_v<N, bool>) {
      if (data == "1")
        return true;
      if (data == "0")
        return false;
    } else if constexpr (std::is_floating_point_v<N>) {
      const std::string text(data);
      char *end = nullptr;
      const long double v = std::strtold(text.c_str(), &end);
      if (!text.empty() && end == text.c_str() + text.size())
        return static_cast<N>(v);
    } else {
      N v{};
      const auto [ptr, ec] =
          std::from_chars(data.data(), data.data() + data.size(), v);
      if (ec == std::errc() && ptr == data.data() + data.size())
        return v;
    }
    if (err)
      *err = make_error(ErrorCode::Deserialize, {}, {},
                        "not a number: '" + std::string(data) + "'");
    return std::nullopt;
  }
};

template <typename T>
inline constexpr bool has_default_serializer_v =
    std::is_same_v<T, std::string> || std::is_same_v<T, Bytes> ||
    std::is_arithmetic_v<T>;

template <typename T> std::unique_ptr<Serializer<T>> default_serializer() {
  static_assert(has_default_serializer_v<T>,
                "no default serializer; pass one explicitly");
  if constexpr (std::is_same_v<T, std::string>)
    return std::make_unique<StringSerializer>();
  else if constexpr (std::is_same_v<T, Bytes>)
    return std::make_unique<BytesSerializer>();
  else
    return std::make_unique<NumberSerializer<T>>();
}

} // namespace cachekit
