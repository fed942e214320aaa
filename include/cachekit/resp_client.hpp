#pragma once

#include "cachekit/context.hpp"
#include "cachekit/error.hpp"
#include "cachekit/resp.hpp"
#include "cachekit/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cachekit {

struct Endpoint {
  std::string host{"127.0.0.1"};
  int port{6379};
  int db{0};
  std::string password;
};

// Accepts redis://[[user]:password@]host[:port][/db] and host:port.
bool parse_remote_url(const std::string &url, Endpoint &out,
                      std::string *err = nullptr);

struct RespClientOptions {
  Endpoint endpoint;
  std::size_t pool_size{10};
  std::size_t max_retries{3};
  Duration conn_timeout{std::chrono::seconds(5)};
  Duration read_timeout{std::chrono::seconds(3)};
  Duration write_timeout{std::chrono::seconds(3)};
};

using RespCommand = std::vector<std::string>;

// One blocking TCP connection. Any transport or protocol failure leaves it
// unusable.
class RespConnection {
public:
  explicit RespConnection(const RespClientOptions &opts) : opts_(opts) {}
  ~RespConnection();

  RespConnection(const RespConnection &) = delete;
  RespConnection &operator=(const RespConnection &) = delete;

  bool open(const Context &ctx, Error *err = nullptr);
  bool write_all(const Context &ctx, std::string_view data,
                 Error *err = nullptr);
  std::optional<RespReply> read_reply(const Context &ctx,
                                      Error *err = nullptr);
  void close();
  bool healthy() const { return fd_ >= 0 && !broken_; }

private:
  // Waits for the socket, honoring both the I/O timeout and ctx.
  bool wait_ready(const Context &ctx, short events, Duration timeout,
                  Error *err);
  bool fail(ErrorCode code, std::string detail, Error *err);

  const RespClientOptions &opts_;
  int fd_{-1};
  bool broken_{false};
  RespReplyParser parser_;
};

// Pooled client. Commands are retried on a fresh connection after
// connection failures, up to max_retries times.
class RespClient {
  struct Token {
    explicit Token() = default;
  };

public:
  RespClient(Token, RespClientOptions opts) : opts_(std::move(opts)) {}

  // Opens one connection and PINGs it; nullptr plus a Connection error on
  // failure.
  static std::unique_ptr<RespClient> connect(const RespClientOptions &opts,
                                             const Context &ctx,
                                             Error *err = nullptr);
  ~RespClient();

  RespClient(const RespClient &) = delete;
  RespClient &operator=(const RespClient &) = delete;

  std::optional<RespReply> command(const Context &ctx, const RespCommand &cmd,
                                   std::string_view op,
                                   const std::string &key = {},
                                   Error *err = nullptr);

  // Writes every command before reading any reply. Replies come back in
  // command order.
  std::optional<std::vector<RespReply>>
  pipeline(const Context &ctx, const std::vector<RespCommand> &cmds,
           std::string_view op, const std::string &key = {},
           Error *err = nullptr);

  void close();
  std::size_t idle_connections() const;
  const RespClientOptions &options() const { return opts_; }

private:

  std::unique_ptr<RespConnection> acquire(const Context &ctx,
                                          std::string_view op, Error *err);
  void release(std::unique_ptr<RespConnection> conn);
  std::optional<std::vector<RespReply>>
  exchange(RespConnection &conn, const Context &ctx,
           const std::vector<RespCommand> &cmds, Error *err);

  const RespClientOptions opts_;
  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::deque<std::unique_ptr<RespConnection>> idle_;
  std::size_t open_{0};
  bool closed_{false};
};

} // namespace cachekit
