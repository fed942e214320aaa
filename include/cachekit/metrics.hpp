#pragma once

#include "cachekit/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cachekit {

using Nanos = std::chrono::nanoseconds;

struct OperationSnapshot {
  std::uint64_t count{0};
  std::uint64_t total_items{0};
  Nanos min_duration{0};
  Nanos max_duration{0};
  Nanos avg_duration{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t errors{0};
};

struct CacheStats {
  std::string backend;
  std::uint64_t items{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  double hit_rate{0.0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  Duration uptime{0};
  bool refresh_ttl_on_hit{false};
};

// Thread-safe per-operation counters. Entries are created on first record
// and only dropped by reset().
class MetricsCollector {
public:
  explicit MetricsCollector(bool enabled = true) : enabled_(enabled) {}

  MetricsCollector(const MetricsCollector &) = delete;
  MetricsCollector &operator=(const MetricsCollector &) = delete;

  void record_operation(std::string_view op, Nanos duration,
                        std::size_t items);
  void record_hit(std::string_view op, std::uint64_t n = 1);
  void record_miss(std::string_view op, std::uint64_t n = 1);
  void record_error(std::string_view op);

  std::map<std::string, OperationSnapshot> snapshot() const;
  std::optional<OperationSnapshot> snapshot(std::string_view op) const;
  void reset();

  // "op.field:value" lines, sorted by operation name.
  std::string info() const;

  bool enabled() const { return enabled_; }

private:
  struct OperationStats {
    std::uint64_t count{0};
    std::uint64_t total_items{0};
    Nanos total_duration{0};
    Nanos min_duration{0};
    Nanos max_duration{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
  };

  OperationStats &stats_for(std::string_view op);
  OperationSnapshot make_snapshot(const std::string &op,
                                  const OperationStats &s) const;

  const bool enabled_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, OperationStats> operations_;
  std::unordered_map<std::string, std::uint64_t> errors_;
};

// hits / (hits + misses), 0 when both are zero.
double hit_rate(std::uint64_t hits, std::uint64_t misses);

CacheStats merge_stats(const std::vector<CacheStats> &stats);
std::string format_stats(const CacheStats &stats);

} // namespace cachekit
