#include "cachekit/resp.hpp"

#include <charconv>

namespace cachekit {
namespace {
constexpr int kMaxReplyDepth = 8;
constexpr long long kMaxReplyElements = 1 << 20;

bool parse_int(std::string_view text, long long &out) {
  if (text.empty())
    return false;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::vector<std::string> malformed() {
  return std::vector<std::string>{kMalformedCommand};
}
} // namespace

void RespParser::feed(std::string_view data) { buffer_.append(data); }

std::optional<std::vector<std::string>> RespParser::next_command() {
  if (buffer_.empty())
    return std::nullopt;
  auto crlf = buffer_.find("\r\n");
  if (crlf == std::string::npos)
    return std::nullopt;
  if (buffer_[0] != '*') {
    buffer_.erase(0, crlf + 2);
    return malformed();
  }
  long long argc = 0;
  if (!parse_int(std::string_view(buffer_).substr(1, crlf - 1), argc) ||
      argc < 0 || argc > static_cast<long long>(kMaxRespArgs)) {
    buffer_.erase(0, crlf + 2);
    return malformed();
  }
  std::size_t pos = crlf + 2;
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (long long i = 0; i < argc; ++i) {
    std::string token;
    if (!parse_bulk_string(pos, token))
      return std::nullopt;
    out.push_back(std::move(token));
  }
  buffer_.erase(0, pos);
  return out;
}

bool RespParser::parse_bulk_string(std::size_t &pos, std::string &out) const {
  if (pos >= buffer_.size() || buffer_[pos] != '$')
    return false;
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return false;
  long long len = 0;
  if (!parse_int(std::string_view(buffer_).substr(pos + 1, crlf - pos - 1),
                 len))
    return false;
  if (len < 0 || len > static_cast<long long>(kMaxRespBulk))
    return false;
  const std::size_t data_start = crlf + 2;
  const std::size_t data_end = data_start + static_cast<std::size_t>(len);
  if (data_end + 2 > buffer_.size())
    return false;
  if (buffer_.compare(data_end, 2, "\r\n") != 0)
    return false;
  out = buffer_.substr(data_start, static_cast<std::size_t>(len));
  pos = data_end + 2;
  return true;
}

void RespReplyParser::feed(std::string_view data) { buffer_.append(data); }

void RespReplyParser::reset() {
  buffer_.clear();
  malformed_ = false;
}

std::optional<RespReply> RespReplyParser::next_reply() {
  if (malformed_ || buffer_.empty())
    return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  switch (parse(pos, reply, 0)) {
  case Status::Ok:
    buffer_.erase(0, pos);
    return reply;
  case Status::Malformed:
    malformed_ = true;
    return std::nullopt;
  case Status::Incomplete:
    break;
  }
  return std::nullopt;
}

RespReplyParser::Status RespReplyParser::parse(std::size_t &pos,
                                               RespReply &out,
                                               int depth) const {
  if (depth > kMaxReplyDepth)
    return Status::Malformed;
  if (pos >= buffer_.size())
    return Status::Incomplete;
  const auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos)
    return Status::Incomplete;
  const char tag = buffer_[pos];
  const std::string_view line =
      std::string_view(buffer_).substr(pos + 1, crlf - pos - 1);
  std::size_t next = crlf + 2;

  switch (tag) {
  case '+':
    out.type = RespReply::Type::Simple;
    out.str = std::string(line);
    break;
  case '-':
    out.type = RespReply::Type::Error;
    out.str = std::string(line);
    break;
  case ':':
    out.type = RespReply::Type::Integer;
    if (!parse_int(line, out.integer))
      return Status::Malformed;
    break;
  case '$': {
    long long len = 0;
    if (!parse_int(line, len) || len < -1 ||
        len > static_cast<long long>(kMaxRespBulk))
      return Status::Malformed;
    if (len == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    const std::size_t end = next + static_cast<std::size_t>(len);
    if (end + 2 > buffer_.size())
      return Status::Incomplete;
    if (buffer_.compare(end, 2, "\r\n") != 0)
      return Status::Malformed;
    out.type = RespReply::Type::Bulk;
    out.str = buffer_.substr(next, static_cast<std::size_t>(len));
    next = end + 2;
    break;
  }
  case '*': {
    long long n = 0;
    if (!parse_int(line, n) || n < -1 || n > kMaxReplyElements)
      return Status::Malformed;
    if (n == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    out.type = RespReply::Type::Array;
    out.elements.resize(static_cast<std::size_t>(n));
    for (auto &element : out.elements) {
      const auto st = parse(next, element, depth + 1);
      if (st != Status::Ok)
        return st;
    }
    break;
  }
  default:
    return Status::Malformed;
  }
  pos = next;
  return Status::Ok;
}

std::string escape_glob(const std::string &literal) {
  std::string out;
  out.reserve(literal.size());
  for (const char c : literal) {
    if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

bool glob_prefix(const std::string &pattern, std::string &prefix) {
  if (pattern.empty() || pattern.back() != '*')
    return false;
  std::string out;
  for (std::size_t i = 0; i + 1 < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c == '\\') {
      if (i + 2 >= pattern.size())
        return false;
      out.push_back(pattern[++i]);
      continue;
    }
    if (c == '*' || c == '?' || c == '[' || c == ']')
      return false;
    out.push_back(c);
  }
  prefix = std::move(out);
  return true;
}

std::string encode_command(const std::vector<std::string> &args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto &a : args)
    out += resp_bulk(a);
  return out;
}

std::string resp_simple(const std::string &s) { return "+" + s + "\r\n"; }
std::string resp_error(const std::string &s) { return "-ERR " + s + "\r\n"; }
std::string resp_integer(long long v) {
  return ":" + std::to_string(v) + "\r\n";
}
std::string resp_bulk(const std::string &s) {
  return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n";
}
std::string resp_null() { return "$-1\r\n"; }
std::string resp_array(const std::vector<std::string> &items) {
  std::string out = "*" + std::to_string(items.size()) + "\r\n";
  for (const auto &i : items)
    out += i;
  return out;
}

} // namespace cachekit
