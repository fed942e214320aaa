#include "cachekit/metrics.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace cachekit {

MetricsCollector::OperationStats &
MetricsCollector::stats_for(std::string_view op) {
  auto it = operations_.find(std::string(op));
  if (it == operations_.end())
    it = operations_.emplace(std::string(op), OperationStats{}).first;
  return it->second;
}

void MetricsCollector::record_operation(std::string_view op, Nanos duration,
                                        std::size_t items) {
  if (!enabled_ || op.empty() || items == 0)
    return;
  std::unique_lock lock(mutex_);
  auto &s = stats_for(op);
  ++s.count;
  s.total_items += items;
  s.total_duration += duration;
  if (s.min_duration.count() == 0 || duration < s.min_duration)
    s.min_duration = duration;
  if (duration > s.max_duration)
    s.max_duration = duration;
}

void MetricsCollector::record_hit(std::string_view op, std::uint64_t n) {
  if (!enabled_ || op.empty() || n == 0)
    return;
  std::unique_lock lock(mutex_);
  stats_for(op).hits += n;
}

void MetricsCollector::record_miss(std::string_view op, std::uint64_t n) {
  if (!enabled_ || op.empty() || n == 0)
    return;
  std::unique_lock lock(mutex_);
  stats_for(op).misses += n;
}

void MetricsCollector::record_error(std::string_view op) {
  if (!enabled_ || op.empty())
    return;
  std::unique_lock lock(mutex_);
  ++errors_[std::string(op)];
}

OperationSnapshot
MetricsCollector::make_snapshot(const std::string &op,
                                const OperationStats &s) const {
  OperationSnapshot out;
  out.count = s.count;
  out.total_items = s.total_items;
  out.min_duration = s.min_duration;
  out.max_duration = s.max_duration;
  if (s.count > 0)
    out.avg_duration = s.total_duration / static_cast<Nanos::rep>(s.count);
  out.hits = s.hits;
  out.misses = s.misses;
  auto it = errors_.find(op);
  if (it != errors_.end())
    out.errors = it->second;
  return out;
}

std::map<std::string, OperationSnapshot> MetricsCollector::snapshot() const {
  std::map<std::string, OperationSnapshot> out;
  if (!enabled_)
    return out;
  std::shared_lock lock(mutex_);
  for (const auto &[op, s] : operations_)
    out.emplace(op, make_snapshot(op, s));
  for (const auto &e : errors_)
    if (!operations_.count(e.first))
      out.emplace(e.first, make_snapshot(e.first, OperationStats{}));
  return out;
}

std::optional<OperationSnapshot>
MetricsCollector::snapshot(std::string_view op) const {
  if (!enabled_)
    return std::nullopt;
  std::shared_lock lock(mutex_);
  const std::string name(op);
  if (auto it = operations_.find(name); it != operations_.end())
    return make_snapshot(name, it->second);
  if (errors_.count(name))
    return make_snapshot(name, OperationStats{});
  return std::nullopt;
}

void MetricsCollector::reset() {
  std::unique_lock lock(mutex_);
  operations_.clear();
  errors_.clear();
}

std::string MetricsCollector::info() const {
  std::ostringstream os;
  for (const auto &[op, s] : snapshot()) {
    os << op << ".count:" << s.count << "\n";
    os << op << ".items:" << s.total_items << "\n";
    os << op << ".hits:" << s.hits << "\n";
    os << op << ".misses:" << s.misses << "\n";
    os << op << ".errors:" << s.errors << "\n";
    os << op << ".avg_us:"
       << std::chrono::duration_cast<std::chrono::microseconds>(
              s.avg_duration)
              .count()
       << "\n";
    os << op << ".max_us:"
       << std::chrono::duration_cast<std::chrono::microseconds>(
              s.max_duration)
              .count()
       << "\n";
  }
  return os.str();
}

double hit_rate(std::uint64_t hits, std::uint64_t misses) {
  const auto total = hits + misses;
  if (total == 0)
    return 0.0;
  return static_cast<double>(hits) / static_cast<double>(total);
}

CacheStats merge_stats(const std::vector<CacheStats> &stats) {
  CacheStats out;
  if (stats.empty())
    return out;
  out.backend = "merged";
  for (const auto &s : stats) {
    out.items += s.items;
    out.hits += s.hits;
    out.misses += s.misses;
    out.evictions += s.evictions;
    out.expirations += s.expirations;
    out.uptime = std::max(out.uptime, s.uptime);
    out.refresh_ttl_on_hit = out.refresh_ttl_on_hit || s.refresh_ttl_on_hit;
  }
  out.hit_rate = hit_rate(out.hits, out.misses);
  return out;
}

std::string format_stats(const CacheStats &s) {
  std::ostringstream os;
  os << "backend:" << s.backend << "\n";
  os << "items:" << s.items << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "uptime_ms:" << s.uptime.count() << "\n";
  os << "refresh_on_hit:" << (s.refresh_ttl_on_hit ? 1 : 0) << "\n";
  return os.str();
}

} // namespace cachekit
