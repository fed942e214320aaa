#include "cachekit/logging.hpp"
#include "cachekit/resp_client.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split_words(const std::string &line) {
  std::vector<std::string> out;
  std::istringstream in(line);
  std::string w;
  while (in >> w)
    out.push_back(w);
  return out;
}

void print_reply(const cachekit::RespReply &r, const std::string &indent = {}) {
  using Type = cachekit::RespReply::Type;
  switch (r.type) {
  case Type::Simple:
    std::cout << r.str << "\n";
    break;
  case Type::Error:
    std::cout << "(error) " << r.str << "\n";
    break;
  case Type::Integer:
    std::cout << "(integer) " << r.integer << "\n";
    break;
  case Type::Bulk:
    std::cout << '"' << r.str << "\"\n";
    break;
  case Type::Null:
    std::cout << "(nil)\n";
    break;
  case Type::Array:
    if (r.elements.empty())
      std::cout << "(empty array)\n";
    for (std::size_t i = 0; i < r.elements.size(); ++i) {
      std::cout << (i == 0 ? "" : indent) << i + 1 << ") ";
      print_reply(r.elements[i], indent + "   ");
    }
    break;
  }
}

} // namespace

int main(int argc, char **argv) {
  std::string url = "redis://127.0.0.1:6379";
  if (argc > 1)
    url = argv[1];
  if (url.find_first_not_of("0123456789") == std::string::npos)
    url = "127.0.0.1:" + url;

  cachekit::RespClientOptions opts;
  std::string url_err;
  if (!cachekit::parse_remote_url(url, opts.endpoint, &url_err)) {
    std::cerr << url_err << "\n";
    return 2;
  }
  opts.pool_size = 1;
  opts.max_retries = 1;
  cachekit::set_log_level("warn");

  cachekit::Error err;
  auto client = cachekit::RespClient::connect(
      opts, cachekit::Context::background().with_timeout(opts.conn_timeout),
      &err);
  if (!client) {
    std::cerr << "connect failed: " << err.message() << "\n";
    return 1;
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "quit")
      break;
    auto args = split_words(line);
    if (args.empty())
      continue;
    auto reply = client->command(cachekit::Context::background(), args,
                                 "cli", {}, &err);
    if (!reply) {
      std::cerr << err.message() << "\n";
      if (cachekit::is_connection_error(err))
        return 1;
      continue;
    }
    print_reply(*reply);
  }
  client->close();
  return 0;
}
