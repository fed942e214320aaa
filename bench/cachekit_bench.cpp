#include "cachekit/advanced_cache.hpp"
#include "cachekit/logging.hpp"
#include "cachekit/memory_cache.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <thread>

using namespace cachekit;

namespace {

struct Result {
  double ops_per_sec{0};
  double p50_us{0};
  double p95_us{0};
  double p99_us{0};
  double hit_rate{0};
};

Result run_workload(const std::string &preset, std::size_t max_entries,
                    int threads, int ops_per_thread) {
  CacheConfig cfg;
  cfg.max_entries = max_entries;
  cfg.cleanup_interval = Duration(0);
  auto store = MemoryCache<std::string>::create(cfg);
  AdvancedCache<std::string> cache(*store, cfg);
  const auto ctx = Context::background();

  std::vector<std::vector<double>> lat(static_cast<std::size_t>(threads));
  const auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937_64 rng(42 + static_cast<std::uint64_t>(t));
      std::uniform_int_distribution<int> u(0, 9999);
      auto &mine = lat[static_cast<std::size_t>(t)];
      mine.reserve(static_cast<std::size_t>(ops_per_thread));
      const std::string value(64, 'v');
      for (int i = 0; i < ops_per_thread; ++i) {
        int k = u(rng);
        if (preset == "hotset")
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        const std::string key = "k" + std::to_string(k);
        const bool do_write =
            preset == "writeheavy" ? (i % 2 == 0) : (i % 5 == 0);
        const auto t0 = std::chrono::steady_clock::now();
        if (do_write)
          cache.set(ctx, key, value, Duration(0));
        else
          cache.get(ctx, key);
        const auto t1 = std::chrono::steady_clock::now();
        mine.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
    });
  }
  for (auto &w : workers)
    w.join();
  const auto end = std::chrono::steady_clock::now();

  std::vector<double> all;
  for (auto &l : lat)
    all.insert(all.end(), l.begin(), l.end());
  std::sort(all.begin(), all.end());
  auto pct = [&](double p) {
    return all[static_cast<std::size_t>(p * (all.size() - 1))];
  };
  Result r;
  r.ops_per_sec = static_cast<double>(all.size()) /
                  std::chrono::duration<double>(end - start).count();
  r.p50_us = pct(0.50);
  r.p95_us = pct(0.95);
  r.p99_us = pct(0.99);
  r.hit_rate = cache.stats(ctx).hit_rate;
  Error close_err;
  if (!cache.close(&close_err))
    logger()->warn("close: {}", close_err.message());
  return r;
}

} // namespace

int main() {
  set_log_level("warn");
  const std::vector<std::string> presets = {"hotset", "uniform",
                                            "writeheavy"};
  const std::vector<std::size_t> sizes = {1000, 10000};
  const std::vector<int> thread_counts = {1, 4};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    for (const auto size : sizes) {
      for (const auto threads : thread_counts) {
        const auto r = run_workload(preset, size, threads, 20000);
        std::cout << "max_entries=" << size << " threads=" << threads
                  << " ops/s=" << std::fixed << std::setprecision(2)
                  << r.ops_per_sec << " p50_us=" << r.p50_us
                  << " p95_us=" << r.p95_us << " p99_us=" << r.p99_us
                  << " hit_rate=" << r.hit_rate << "\n";
      }
    }
  }
  return 0;
}
