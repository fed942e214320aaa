#include "cachekit/resp_client.hpp"
#include "cachekit/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace cachekit {
namespace {
constexpr Duration kPollSlice{50};
constexpr Duration kBaseBackoff{8};
constexpr Duration kMaxBackoff{512};

bool parse_int(std::string_view s, int &out) {
  if (s.empty())
    return false;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool set_error(std::string *err, std::string msg) {
  if (err)
    *err = std::move(msg);
  return false;
}

void annotate(Error &e, std::string_view op, const std::string &key) {
  if (e.op.empty())
    e.op = std::string(op);
  if (e.key.empty())
    e.key = key;
}
} // namespace

bool parse_remote_url(const std::string &url, Endpoint &out,
                      std::string *err) {
  std::string_view rest(url);
  if (const auto scheme = rest.find("://"); scheme != std::string_view::npos) {
    const auto name = rest.substr(0, scheme);
    if (name != "redis" && name != "tcp")
      return set_error(err, "unsupported url scheme: " + std::string(name));
    rest.remove_prefix(scheme + 3);
  }
  Endpoint ep;
  if (const auto at = rest.rfind('@'); at != std::string_view::npos) {
    const auto userinfo = rest.substr(0, at);
    const auto colon = userinfo.find(':');
    ep.password = std::string(colon == std::string_view::npos
                                  ? userinfo
                                  : userinfo.substr(colon + 1));
    rest.remove_prefix(at + 1);
  }
  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    const auto db = rest.substr(slash + 1);
    if (!db.empty() && (!parse_int(db, ep.db) || ep.db < 0))
      return set_error(err, "invalid database index in url: " + url);
    rest = rest.substr(0, slash);
  }
  if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
    if (!parse_int(rest.substr(colon + 1), ep.port) || ep.port <= 0 ||
        ep.port > 65535)
      return set_error(err, "invalid port in url: " + url);
    rest = rest.substr(0, colon);
  }
  if (!rest.empty())
    ep.host = std::string(rest);
  out = std::move(ep);
  return true;
}

RespConnection::~RespConnection() { close(); }

void RespConnection::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}

bool RespConnection::fail(ErrorCode code, std::string detail, Error *err) {
  broken_ = true;
  if (err)
    *err = make_error(code, {}, {}, std::move(detail));
  return false;
}

bool RespConnection::open(const Context &ctx, Error *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const auto port = std::to_string(opts_.endpoint.port);
  const int rc =
      ::getaddrinfo(opts_.endpoint.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0)
    return fail(ErrorCode::Connection,
                "resolve " + opts_.endpoint.host + ": " + ::gai_strerror(rc),
                err);
  std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res,
                                                             ::freeaddrinfo);

  std::string last = "no usable address";
  for (auto *ai = res; ai != nullptr; ai = ai->ai_next) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                            ai->ai_protocol);
    if (fd < 0) {
      last = std::strerror(errno);
      continue;
    }
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    fd_ = fd;
    broken_ = false;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        last = std::strerror(errno);
        close();
        continue;
      }
      Error wait_err;
      if (!wait_ready(ctx, POLLOUT, opts_.conn_timeout, &wait_err)) {
        close();
        if (is_context_error(wait_err)) {
          if (err)
            *err = std::move(wait_err);
          return false;
        }
        last = wait_err.detail;
        continue;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
      if (so_error != 0) {
        last = std::strerror(so_error);
        close();
        continue;
      }
    }
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    broken_ = false;
    return true;
  }
  return fail(ErrorCode::Connection,
              "connect " + opts_.endpoint.host + ":" + port + ": " + last,
              err);
}

bool RespConnection::wait_ready(const Context &ctx, short events,
                                Duration timeout, Error *err) {
  const auto limit = Clock::now() + timeout;
  for (;;) {
    if (const auto code = ctx.err(); code != ErrorCode::None)
      return fail(code, {}, err);
    const auto now = Clock::now();
    if (now >= limit)
      return fail(ErrorCode::Connection, "i/o timeout", err);
    auto slice = std::min<Duration>(
        std::chrono::ceil<Duration>(limit - now), kPollSlice);
    if (auto deadline = ctx.deadline(); deadline && *deadline > now)
      slice = std::min<Duration>(
          slice, std::chrono::ceil<Duration>(*deadline - now));
    pollfd p{fd_, events, 0};
    const int rc = ::poll(&p, 1, static_cast<int>(slice.count()));
    if (rc > 0) {
      if ((p.revents & (POLLERR | POLLNVAL)) && !(p.revents & events))
        return fail(ErrorCode::Connection, "socket error", err);
      return true;
    }
    if (rc < 0 && errno != EINTR)
      return fail(ErrorCode::Connection, std::strerror(errno), err);
  }
}

bool RespConnection::write_all(const Context &ctx, std::string_view data,
                               Error *err) {
  if (!healthy())
    return fail(ErrorCode::Connection, "connection not open", err);
  while (!data.empty()) {
    const auto n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (n > 0) {
      data.remove_prefix(static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (!wait_ready(ctx, POLLOUT, opts_.write_timeout, err))
        return false;
      continue;
    }
    return fail(ErrorCode::Connection,
                n == 0 ? "short write" : std::strerror(errno), err);
  }
  return true;
}

std::optional<RespReply> RespConnection::read_reply(const Context &ctx,
                                                    Error *err) {
  char buf[16384];
  for (;;) {
    if (auto reply = parser_.next_reply())
      return reply;
    if (parser_.malformed()) {
      fail(ErrorCode::Protocol, "malformed reply", err);
      return std::nullopt;
    }
    if (!healthy()) {
      fail(ErrorCode::Connection, "connection not open", err);
      return std::nullopt;
    }
    if (!wait_ready(ctx, POLLIN, opts_.read_timeout, err))
      return std::nullopt;
    const auto n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n > 0) {
      parser_.feed(std::string_view(buf, static_cast<std::size_t>(n)));
      continue;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK))
      continue;
    fail(ErrorCode::Connection,
         n == 0 ? "connection closed by peer" : std::strerror(errno), err);
    return std::nullopt;
  }
}

std::unique_ptr<RespClient> RespClient::connect(const RespClientOptions &opts,
                                                const Context &ctx,
                                                Error *err) {
  auto client = std::make_unique<RespClient>(Token{}, opts);
  Error e;
  auto reply = client->command(ctx, {"PING"}, op::kPing, {}, &e);
  if (!reply || reply->is_error()) {
    if (reply)
      e = make_error(ErrorCode::Connection, op::kPing, {}, reply->str);
    else if (!is_context_error(e))
      e.code = ErrorCode::Connection;
    logger()->error("remote store {}:{} unreachable: {}", opts.endpoint.host,
                    opts.endpoint.port, e.message());
    if (err)
      *err = std::move(e);
    return nullptr;
  }
  return client;
}

RespClient::~RespClient() { close(); }

void RespClient::close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
  open_ -= idle_.size();
  idle_.clear();
  released_.notify_all();
}

std::size_t RespClient::idle_connections() const {
  std::lock_guard lock(mutex_);
  return idle_.size();
}

std::unique_ptr<RespConnection>
RespClient::acquire(const Context &ctx, std::string_view op, Error *err) {
  {
    std::unique_lock lock(mutex_);
    for (;;) {
      if (closed_) {
        if (err)
          *err = make_error(ErrorCode::Connection, op, {}, "client closed");
        return nullptr;
      }
      if (!idle_.empty()) {
        auto conn = std::move(idle_.front());
        idle_.pop_front();
        return conn;
      }
      if (open_ < std::max<std::size_t>(opts_.pool_size, 1)) {
        ++open_;
        break;
      }
      if (!ctx.check(op, {}, err))
        return nullptr;
      released_.wait_for(lock, kPollSlice);
    }
  }

  auto conn = std::make_unique<RespConnection>(opts_);
  bool ok = conn->open(ctx, err);
  std::vector<RespCommand> setup;
  if (!opts_.endpoint.password.empty())
    setup.push_back({"AUTH", opts_.endpoint.password});
  if (opts_.endpoint.db != 0)
    setup.push_back({"SELECT", std::to_string(opts_.endpoint.db)});
  if (ok && !setup.empty()) {
    auto replies = exchange(*conn, ctx, setup, err);
    ok = replies.has_value();
    for (const auto &r : replies.value_or(std::vector<RespReply>{})) {
      if (r.is_error()) {
        if (err)
          *err = make_error(ErrorCode::Connection, op, {}, r.str);
        ok = false;
        break;
      }
    }
  }
  if (!ok) {
    std::lock_guard lock(mutex_);
    --open_;
    released_.notify_one();
    return nullptr;
  }
  return conn;
}

void RespClient::release(std::unique_ptr<RespConnection> conn) {
  if (!conn)
    return;
  {
    std::lock_guard lock(mutex_);
    if (conn->healthy() && !closed_)
      idle_.push_back(std::move(conn));
    else
      --open_;
  }
  released_.notify_one();
}

std::optional<std::vector<RespReply>>
RespClient::exchange(RespConnection &conn, const Context &ctx,
                     const std::vector<RespCommand> &cmds, Error *err) {
  std::string payload;
  for (const auto &c : cmds)
    payload += encode_command(c);
  if (!conn.write_all(ctx, payload, err))
    return std::nullopt;
  std::vector<RespReply> replies;
  replies.reserve(cmds.size());
  for (std::size_t i = 0; i < cmds.size(); ++i) {
    auto reply = conn.read_reply(ctx, err);
    if (!reply)
      return std::nullopt;
    replies.push_back(std::move(*reply));
  }
  return replies;
}

std::optional<RespReply> RespClient::command(const Context &ctx,
                                             const RespCommand &cmd,
                                             std::string_view op,
                                             const std::string &key,
                                             Error *err) {
  auto replies = pipeline(ctx, {cmd}, op, key, err);
  if (!replies)
    return std::nullopt;
  return std::move(replies->front());
}

std::optional<std::vector<RespReply>>
RespClient::pipeline(const Context &ctx, const std::vector<RespCommand> &cmds,
                     std::string_view op, const std::string &key,
                     Error *err) {
  if (cmds.empty())
    return std::vector<RespReply>{};
  Error last;
  for (std::size_t attempt = 0; attempt <= opts_.max_retries; ++attempt) {
    if (attempt > 0) {
      const auto shift = std::min<std::size_t>(attempt, 6);
      std::this_thread::sleep_for(
          std::min<Duration>(kBaseBackoff * (1 << shift), kMaxBackoff));
    }
    if (!ctx.check(op, key, &last))
      break;
    Error e;
    auto conn = acquire(ctx, op, &e);
    std::optional<std::vector<RespReply>> replies;
    if (conn)
      replies = exchange(*conn, ctx, cmds, &e);
    release(std::move(conn));
    if (replies)
      return replies;
    annotate(e, op, key);
    last = std::move(e);
    if (!is_connection_error(last))
      break;
    logger()->warn("{}: attempt {}/{} against {}:{} failed: {}", op,
                   attempt + 1, opts_.max_retries + 1, opts_.endpoint.host,
                   opts_.endpoint.port, last.message());
  }
  if (err)
    *err = std::move(last);
  return std::nullopt;
}

} // namespace cachekit
