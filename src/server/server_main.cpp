#include "cachekit/advanced_cache.hpp"
#include "cachekit/config.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/memory_cache.hpp"
#include "cachekit/resp.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <netinet/in.h>
#include <optional>
#include <sstream>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

using Store = cachekit::MemoryCache<std::string>;
using Cache = cachekit::AdvancedCache<std::string>;

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return !s.empty() && ec == std::errc() && ptr == s.data() + s.size();
}

struct ClientState {
  cachekit::RespParser parser;
  std::string out;
};

struct ServerStats {
  std::uint64_t rejected_requests{0};
  std::uint64_t total_request_bytes{0};
  std::uint64_t request_count{0};
};

class CommandHandler {
public:
  CommandHandler(Store &store, Cache &cache, ServerStats &stats)
      : store_(store), cache_(cache), stats_(stats) {}

  std::string handle(const std::vector<std::string> &cmd,
                     std::size_t connected) {
    const auto name = upper(cmd[0]);
    if (name == "PING")
      return cmd.size() > 1 ? cachekit::resp_bulk(cmd[1])
                            : cachekit::resp_simple("PONG");
    if (name == "GET")
      return get(cmd);
    if (name == "SET")
      return set(cmd);
    if (name == "MGET")
      return mget(cmd);
    if (name == "DEL")
      return del(cmd);
    if (name == "EXISTS")
      return exists(cmd);
    if (name == "PEXPIRE")
      return pexpire(cmd);
    if (name == "SCAN")
      return scan(cmd);
    if (name == "DBSIZE")
      return dbsize();
    if (name == "FLUSHDB" || name == "FLUSHALL")
      return flush();
    if (name == "INFO")
      return info(connected);
    return reject("unknown command '" + cmd[0] + "'");
  }

private:
  std::string reject(const std::string &msg) {
    ++stats_.rejected_requests;
    return cachekit::resp_error(msg);
  }

  std::string failure(const cachekit::Error &e) {
    ++stats_.rejected_requests;
    return cachekit::resp_error(e.message());
  }

  std::string get(const std::vector<std::string> &cmd) {
    if (cmd.size() != 2)
      return reject("GET key");
    cachekit::Error e;
    auto v = cache_.get(ctx_, cmd[1], &e);
    if (v)
      return cachekit::resp_bulk(*v);
    return cachekit::is_cache_miss(e) ? cachekit::resp_null() : failure(e);
  }

  std::string set(const std::vector<std::string> &cmd) {
    if (cmd.size() < 3)
      return reject("SET key value [EX sec|PX ms] [NX]");
    std::uint64_t ttl_ms = 0;
    bool nx = false;
    for (std::size_t i = 3; i < cmd.size(); ++i) {
      const auto opt = upper(cmd[i]);
      if (opt == "NX") {
        nx = true;
        continue;
      }
      std::uint64_t n = 0;
      if ((opt != "EX" && opt != "PX") || i + 1 >= cmd.size() ||
          !parse_u64(cmd[i + 1], n) || n == 0)
        return reject("syntax error");
      ttl_ms = opt == "EX" ? n * 1000 : n;
      ++i;
    }
    cachekit::Error e;
    if (nx) {
      auto present = cache_.exists(ctx_, cmd[1], &e);
      if (!present)
        return failure(e);
      if (*present)
        return cachekit::resp_null();
    }
    const auto ttl = cachekit::Duration(static_cast<long long>(ttl_ms));
    if (!cache_.set(ctx_, cmd[1], cmd[2], ttl, &e))
      return failure(e);
    return cachekit::resp_simple("OK");
  }

  std::string mget(const std::vector<std::string> &cmd) {
    if (cmd.size() < 2)
      return reject("MGET key [key...]");
    const std::vector<std::string> keys(cmd.begin() + 1, cmd.end());
    cachekit::Error e;
    auto found = cache_.get_many_pipeline(ctx_, keys, &e);
    if (!found)
      return failure(e);
    std::vector<std::string> arr;
    arr.reserve(keys.size());
    for (const auto &k : keys) {
      auto it = found->find(k);
      arr.push_back(it == found->end() ? cachekit::resp_null()
                                       : cachekit::resp_bulk(it->second));
    }
    return cachekit::resp_array(arr);
  }

  std::string del(const std::vector<std::string> &cmd) {
    if (cmd.size() < 2)
      return reject("DEL key [key...]");
    const std::vector<std::string> keys(cmd.begin() + 1, cmd.end());
    long long removed = 0;
    for (const auto &k : keys)
      if (store_.exists(ctx_, k).value_or(false))
        ++removed;
    cachekit::Error e;
    if (!cache_.del(ctx_, keys, &e))
      return failure(e);
    return cachekit::resp_integer(removed);
  }

  std::string exists(const std::vector<std::string> &cmd) {
    if (cmd.size() < 2)
      return reject("EXISTS key [key...]");
    long long n = 0;
    for (std::size_t i = 1; i < cmd.size(); ++i) {
      cachekit::Error e;
      auto present = cache_.exists(ctx_, cmd[i], &e);
      if (!present)
        return failure(e);
      n += *present ? 1 : 0;
    }
    return cachekit::resp_integer(n);
  }

  // Only the GT form: expiry is extended, never shortened.
  std::string pexpire(const std::vector<std::string> &cmd) {
    std::uint64_t ms = 0;
    if (cmd.size() != 4 || !parse_u64(cmd[2], ms) || ms == 0 ||
        upper(cmd[3]) != "GT")
      return reject("PEXPIRE key ms GT");
    cachekit::Error e;
    auto moved = store_.extend_ttl(
        ctx_, cmd[1], cachekit::Duration(static_cast<long long>(ms)), &e);
    if (!moved)
      return cachekit::is_cache_miss(e) ? cachekit::resp_integer(0)
                                        : failure(e);
    return cachekit::resp_integer(*moved ? 1 : 0);
  }

  // The whole keyspace fits in one reply, so the cursor is always 0.
  // Only "<literal>*" patterns are understood.
  std::string scan(const std::vector<std::string> &cmd) {
    if (cmd.size() < 2)
      return reject("SCAN cursor [MATCH pattern] [COUNT n]");
    std::string prefix;
    for (std::size_t i = 2; i + 1 < cmd.size(); i += 2) {
      const auto opt = upper(cmd[i]);
      if (opt == "MATCH") {
        if (!cachekit::glob_prefix(cmd[i + 1], prefix))
          return reject("only prefix patterns are supported");
      } else if (opt != "COUNT") {
        return reject("syntax error");
      }
    }
    std::vector<std::string> keys;
    for (const auto &k : store_.keys()) {
      if (k.compare(0, prefix.size(), prefix) != 0)
        continue;
      if (store_.exists(ctx_, k).value_or(false))
        keys.push_back(cachekit::resp_bulk(k));
    }
    return cachekit::resp_array(
        {cachekit::resp_bulk("0"), cachekit::resp_array(keys)});
  }

  std::string dbsize() {
    cachekit::Error e;
    auto n = cache_.len(ctx_, &e);
    if (!n)
      return failure(e);
    return cachekit::resp_integer(static_cast<long long>(*n));
  }

  std::string flush() {
    cachekit::Error e;
    if (!cache_.clear(ctx_, &e))
      return failure(e);
    return cachekit::resp_simple("OK");
  }

  std::string info(std::size_t connected) {
    std::ostringstream out;
    out << cachekit::format_stats(cache_.stats(ctx_));
    out << cache_.metrics().info();
    out << "connected_clients:" << connected << "\n";
    out << "rejected_requests:" << stats_.rejected_requests << "\n";
    const double avg_bytes =
        stats_.request_count == 0
            ? 0.0
            : static_cast<double>(stats_.total_request_bytes) /
                  static_cast<double>(stats_.request_count);
    out << "avg_request_bytes:" << avg_bytes << "\n";
    return cachekit::resp_bulk(out.str());
  }

  Store &store_;
  Cache &cache_;
  ServerStats &stats_;
  const cachekit::Context ctx_ = cachekit::Context::background();
};

} // namespace

int main(int argc, char **argv) {
  int port = 6379;
  std::size_t max_connections = 512;
  std::size_t max_pending_out = 8 << 20;

  cachekit::CacheConfig cfg;
  cfg.prefix.clear();
  cfg.ttl = std::chrono::hours(24);
  cfg.cleanup_interval = std::chrono::seconds(1);
  std::string config_path;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t n = 0;
    if (a == "--port" && i + 1 < argc && parse_u64(argv[i + 1], n)) {
      port = static_cast<int>(n);
      ++i;
    } else if (a == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (a == "--max-entries" && i + 1 < argc &&
               parse_u64(argv[i + 1], n)) {
      cfg.max_entries = n;
      ++i;
    } else if (a == "--ttl-ms" && i + 1 < argc && parse_u64(argv[i + 1], n)) {
      cfg.ttl = cachekit::Duration(static_cast<long long>(n));
      ++i;
    } else if (a == "--log-level" && i + 1 < argc) {
      cfg.log_level = argv[++i];
    } else {
      std::cerr << "usage: cachekit_server [--port N] [--config file] "
                   "[--max-entries N] [--ttl-ms N] [--log-level L]\n";
      return 2;
    }
  }

  if (!config_path.empty()) {
    std::string err;
    if (!cachekit::load_config(config_path, cfg, &err)) {
      std::cerr << "config: " << err << "\n";
      return 1;
    }
  }
  cachekit::apply_env_overrides(cfg);
  cachekit::normalize(cfg);
  // Clients namespace their own keys; the server stores them verbatim.
  cfg.prefix.clear();
  cfg.type = cachekit::kTypeMemory;
  cachekit::set_log_level(cfg.log_level);

  cachekit::Error err;
  if (!cachekit::validate(cfg, &err)) {
    cachekit::logger()->error("invalid configuration: {}", err.message());
    return 1;
  }
  auto store = Store::create(cfg, &err);
  if (!store) {
    cachekit::logger()->error("{}", err.message());
    return 1;
  }
  Cache cache(*store, cfg);
  ServerStats stats;
  CommandHandler handler(*store, cache, stats);

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  int one = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    cachekit::logger()->error("bind to port {} failed: {}", port,
                              std::strerror(errno));
    return 1;
  }
  if (listen(server_fd, 128) < 0) {
    cachekit::logger()->error("listen failed: {}", std::strerror(errno));
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);
  std::unordered_map<int, ClientState> clients;
  cachekit::logger()->info("cachekit_server listening on {}", port);

  while (running) {
    fd_set readfds, writefds;
    FD_ZERO(&readfds);
    FD_ZERO(&writefds);
    FD_SET(server_fd, &readfds);
    int maxfd = server_fd;
    for (const auto &[fd, st] : clients) {
      FD_SET(fd, &readfds);
      if (!st.out.empty())
        FD_SET(fd, &writefds);
      maxfd = std::max(maxfd, fd);
    }
    timeval tv{0, 20000};
    int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
    if (n < 0)
      continue;

    if (FD_ISSET(server_fd, &readfds)) {
      int cfd = accept(server_fd, nullptr, nullptr);
      if (cfd >= 0) {
        if (clients.size() >= max_connections || cfd >= FD_SETSIZE) {
          const auto msg = cachekit::resp_error("connection limit reached");
          send(cfd, msg.data(), msg.size(), MSG_NOSIGNAL);
          close(cfd);
          ++stats.rejected_requests;
        } else {
          fcntl(cfd, F_SETFL, fcntl(cfd, F_GETFL, 0) | O_NONBLOCK);
          clients[cfd] = {};
        }
      }
    }

    std::vector<int> to_close;
    for (auto &[fd, st] : clients) {
      if (FD_ISSET(fd, &readfds)) {
        char buf[16384];
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r == 0 || (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
          to_close.push_back(fd);
          continue;
        }
        if (r > 0) {
          stats.total_request_bytes += static_cast<std::uint64_t>(r);
          st.parser.feed(std::string_view(buf, static_cast<std::size_t>(r)));
        }
        while (auto cmd = st.parser.next_command()) {
          ++stats.request_count;
          if (cmd->size() == 1 && cmd->front() == cachekit::kMalformedCommand) {
            ++stats.rejected_requests;
            st.out += cachekit::resp_error("malformed RESP");
            break;
          }
          if (cmd->empty()) {
            ++stats.rejected_requests;
            st.out += cachekit::resp_error("empty command");
            continue;
          }
          st.out += handler.handle(*cmd, clients.size());
          if (st.out.size() > max_pending_out) {
            ++stats.rejected_requests;
            to_close.push_back(fd);
            break;
          }
        }
      }

      if (!st.out.empty()) {
        ssize_t w = send(fd, st.out.data(), st.out.size(), MSG_NOSIGNAL);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
          to_close.push_back(fd);
        else if (w > 0)
          st.out.erase(0, static_cast<std::size_t>(w));
      }
    }

    std::sort(to_close.begin(), to_close.end());
    to_close.erase(std::unique(to_close.begin(), to_close.end()),
                   to_close.end());
    for (int fd : to_close) {
      close(fd);
      clients.erase(fd);
    }
  }

  for (auto &[fd, _] : clients)
    close(fd);
  close(server_fd);
  cachekit::Error close_err;
  if (!cache.close(&close_err))
    cachekit::logger()->warn("close: {}", close_err.message());
  cachekit::logger()->info("cachekit_server stopped");
  return 0;
}
