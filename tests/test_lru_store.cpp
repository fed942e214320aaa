#include "cachekit/lru_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace cachekit;

TEST_CASE("LRU evicts the least recently touched entry", "[lru]") {
  LruStore<std::string, int> s(2);
  CHECK_FALSE(s.set("a", 1).has_value());
  CHECK_FALSE(s.set("b", 2).has_value());
  REQUIRE(s.get("a") == 1);

  auto evicted = s.set("c", 3);
  REQUIRE(evicted.has_value());
  CHECK(*evicted == "b");
  CHECK(s.len() == 2);
  CHECK_FALSE(s.peek("b").has_value());
  CHECK(s.keys() == std::vector<std::string>{"c", "a"});
}

TEST_CASE("LRU insertion order breaks ties", "[lru]") {
  LruStore<std::string, int> s(3);
  s.set("a", 1);
  s.set("b", 2);
  s.set("c", 3);
  CHECK(s.set("d", 4) == std::optional<std::string>("a"));
  CHECK(s.set("e", 5) == std::optional<std::string>("b"));
}

TEST_CASE("LRU peek leaves recency alone", "[lru]") {
  LruStore<std::string, int> s(2);
  s.set("a", 1);
  s.set("b", 2);
  REQUIRE(s.peek("a") == 1);
  CHECK(s.set("c", 3) == std::optional<std::string>("a"));
}

TEST_CASE("LRU replacing a key never evicts", "[lru]") {
  LruStore<std::string, int> s(2);
  s.set("a", 1);
  s.set("b", 2);
  CHECK_FALSE(s.set("a", 10).has_value());
  CHECK(s.len() == 2);
  CHECK(s.get("a") == 10);
  CHECK(s.keys().front() == "a");
}

TEST_CASE("LRU delete, pop and clear", "[lru]") {
  LruStore<std::string, int> s;
  s.set("a", 1);
  s.set("b", 2);
  s.set("c", 3);
  CHECK(s.del("b"));
  CHECK_FALSE(s.del("b"));
  auto oldest = s.pop_oldest();
  REQUIRE(oldest.has_value());
  CHECK(oldest->first == "a");
  CHECK(s.len() == 1);
  s.clear();
  CHECK(s.len() == 0);
  CHECK_FALSE(s.pop_oldest().has_value());
}

TEST_CASE("LRU conditional access removes rejected entries", "[lru]") {
  LruStore<std::string, int> s;
  s.set("keep", 1);
  s.set("drop", 2);
  CHECK(s.get_if("keep", [](int &v) {
    v += 1;
    return true;
  }) == 2);
  CHECK_FALSE(s.get_if("drop", [](int &) { return false; }).has_value());
  CHECK(s.len() == 1);

  s.set("odd", 3);
  CHECK_FALSE(s.contains_if("odd", [](const int &v) { return v % 2 == 0; }));
  CHECK(s.len() == 1);

  s.set("x1", 1);
  s.set("x2", 2);
  const auto removed = s.erase_if(
      [](const std::string &k, const int &) { return k.rfind("x", 0) == 0; });
  CHECK(removed == 2);
  CHECK(s.keys() == std::vector<std::string>{"keep"});
}

TEST_CASE("LRU stays bounded under concurrent writers", "[lru][concurrency]") {
  LruStore<std::string, int> s(64);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&s, t] {
      for (int i = 0; i < 2000; ++i) {
        const auto key = "k" + std::to_string((t * 31 + i) % 200);
        if (i % 3 == 0)
          s.get(key);
        else
          s.set(key, i);
      }
    });
  }
  for (auto &th : threads)
    th.join();
  CHECK(s.len() <= 64);
  CHECK(s.keys().size() == s.len());
}
