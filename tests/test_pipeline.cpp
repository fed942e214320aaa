#include "cachekit/pipeline.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace cachekit;
using namespace std::chrono_literals;

TEST_CASE("bounded executor caps in-flight tasks", "[pipeline]") {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::atomic<int> done{0};
  std::vector<BatchTask> tasks;
  for (int i = 0; i < 32; ++i) {
    tasks.push_back([&](const Context &, Error *) {
      const int now = ++in_flight;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(5ms);
      --in_flight;
      ++done;
      return true;
    });
  }
  Error err;
  REQUIRE(run_bounded(Context::background(), tasks, 4, "batch", &err));
  CHECK(err.ok());
  CHECK(done.load() == 32);
  CHECK(peak.load() <= 4);
  CHECK(peak.load() >= 1);
}

TEST_CASE("bounded executor returns the first error after quiescence",
          "[pipeline]") {
  std::atomic<int> started{0};
  std::atomic<int> finished{0};
  std::vector<BatchTask> tasks;
  for (int i = 0; i < 3; ++i) {
    tasks.push_back([&](const Context &, Error *) {
      ++started;
      std::this_thread::sleep_for(20ms);
      ++finished;
      return true;
    });
  }
  tasks.push_back([&](const Context &, Error *err) {
    *err = make_error(ErrorCode::Connection, "batch", "k3", "boom");
    return false;
  });
  Error err;
  CHECK_FALSE(run_bounded(Context::background(), tasks, 4, "batch", &err));
  CHECK(err.code == ErrorCode::Connection);
  CHECK(err.key == "k3");
  CHECK(started.load() == finished.load());
}

TEST_CASE("bounded executor skips unstarted tasks after a failure",
          "[pipeline]") {
  std::atomic<int> ran{0};
  std::vector<BatchTask> tasks;
  tasks.push_back([&](const Context &, Error *err) {
    ++ran;
    *err = make_error(ErrorCode::Protocol, "batch");
    return false;
  });
  for (int i = 0; i < 10; ++i) {
    tasks.push_back([&](const Context &, Error *) {
      ++ran;
      return true;
    });
  }
  Error err;
  CHECK_FALSE(run_bounded(Context::background(), tasks, 1, "batch", &err));
  CHECK(err.code == ErrorCode::Protocol);
  CHECK(ran.load() == 1);
}

TEST_CASE("bounded executor observes caller cancellation", "[pipeline]") {
  auto ctx = Context::background().with_cancel();
  ctx.cancel();
  std::atomic<int> ran{0};
  std::vector<BatchTask> tasks(5, [&](const Context &, Error *) {
    ++ran;
    return true;
  });
  Error err;
  CHECK_FALSE(run_bounded(ctx, tasks, 2, "batch", &err));
  CHECK(err.code == ErrorCode::Canceled);
  CHECK(err.op == "batch");
  CHECK(ran.load() == 0);
}

TEST_CASE("bounded executor handles an empty batch", "[pipeline]") {
  CHECK(run_bounded(Context::background(), {}, 10, "batch"));
}

TEST_CASE("task failure without detail is reported as compute failure",
          "[pipeline]") {
  std::vector<BatchTask> tasks{[](const Context &, Error *) { return false; }};
  Error err;
  CHECK_FALSE(run_bounded(Context::background(), tasks, 1, "batch", &err));
  CHECK(err.code == ErrorCode::ComputeFailed);
}

TEST_CASE("task pool runs jobs under their own budget", "[pipeline][pool]") {
  TaskPool pool(2, 8);
  std::atomic<int> ran{0};
  std::atomic<bool> had_deadline{false};
  REQUIRE(pool.submit(
      [&](const Context &ctx) {
        had_deadline = ctx.deadline().has_value() && !ctx.done();
        ++ran;
      },
      1s));
  pool.wait_idle();
  CHECK(ran.load() == 1);
  CHECK(had_deadline.load());
}

TEST_CASE("task pool rejects work beyond its queue", "[pipeline][pool]") {
  TaskPool pool(1, 1);
  std::atomic<bool> release{false};
  std::atomic<bool> started{false};
  REQUIRE(pool.submit(
      [&](const Context &) {
        started = true;
        while (!release.load())
          std::this_thread::sleep_for(1ms);
      },
      5s));
  while (!started.load())
    std::this_thread::sleep_for(1ms);
  REQUIRE(pool.submit([](const Context &) {}, 5s));
  CHECK_FALSE(pool.submit([](const Context &) {}, 5s));
  CHECK(pool.rejected() == 1);
  CHECK(pool.pending() == 1);
  release = true;
  pool.wait_idle();
  CHECK(pool.pending() == 0);
}

TEST_CASE("task pool drains queued work on shutdown", "[pipeline][pool]") {
  std::atomic<int> ran{0};
  {
    TaskPool pool(1, 64);
    for (int i = 0; i < 20; ++i)
      REQUIRE(pool.submit([&](const Context &) { ++ran; }, 1s));
  }
  CHECK(ran.load() == 20);
}
