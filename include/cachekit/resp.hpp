#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cachekit {

inline constexpr std::size_t kMaxRespArgs = 1024;
inline constexpr std::size_t kMaxRespBulk = 8 * 1024 * 1024;

// Returned by RespParser::next_command() in place of a request it could
// not decode; the offending line has already been dropped.
inline constexpr const char *kMalformedCommand = "__MALFORMED__";

// Server side: splits a byte stream into command argument vectors.
class RespParser {
public:
  void feed(std::string_view data);
  std::optional<std::vector<std::string>> next_command();
  std::size_t buffered() const { return buffer_.size(); }

private:
  bool parse_bulk_string(std::size_t &pos, std::string &out) const;
  std::string buffer_;
};

struct RespReply {
  enum class Type { Simple, Error, Integer, Bulk, Null, Array };

  Type type{Type::Null};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool is_error() const { return type == Type::Error; }
  bool is_null() const { return type == Type::Null; }
};

// Client side: decodes replies, including nested arrays, from a byte
// stream. After a protocol violation the parser stays malformed.
class RespReplyParser {
public:
  void feed(std::string_view data);
  std::optional<RespReply> next_reply();
  bool malformed() const { return malformed_; }
  void reset();

private:
  enum class Status { Ok, Incomplete, Malformed };
  Status parse(std::size_t &pos, RespReply &out, int depth) const;
  std::string buffer_;
  bool malformed_{false};
};

// Escapes glob metacharacters so a literal can be embedded in a MATCH
// pattern.
std::string escape_glob(const std::string &literal);

// For patterns of the form "<literal>*" stores the unescaped literal in
// prefix. False for any other pattern.
bool glob_prefix(const std::string &pattern, std::string &prefix);

std::string encode_command(const std::vector<std::string> &args);

std::string resp_simple(const std::string &s);
std::string resp_error(const std::string &s);
std::string resp_integer(long long v);
std::string resp_bulk(const std::string &s);
std::string resp_null();
std::string resp_array(const std::vector<std::string> &items);

} // namespace cachekit
