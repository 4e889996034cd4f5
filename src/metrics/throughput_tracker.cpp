/// @file throughput_tracker.cpp
/// @brief ThroughputTracker implementation.

#include "metrics/throughput_tracker.hpp"

namespace loadcurve {

ThroughputTracker::ThroughputTracker() : start_{Clock::now()} {}

void ThroughputTracker::record(const std::string &label,
                               std::chrono::nanoseconds elapsed) {
  record_ms(label,
            std::chrono::duration<double, std::milli>(elapsed).count());
}

void ThroughputTracker::record_ms(const std::string &label,
                                  double elapsed_ms) {
  const auto now = Clock::now();
  std::lock_guard lock(mutex_);
  auto [it, inserted] = counters_.try_emplace(label);
  auto &c = it->second;
  if (inserted) {
    c.first = now;
  }
  ++c.count;
  c.total_ms += elapsed_ms;
  c.last = now;
}

auto ThroughputTracker::make_stats(const std::string &label, const Counter &c,
                                   Clock::time_point now) -> ThroughputStats {
  const std::chrono::duration<double> window = now - c.first;
  return ThroughputStats{
      .label = label,
      .total_count = c.count,
      .avg_time_ms =
          c.count > 0 ? c.total_ms / static_cast<double>(c.count) : 0.0,
      .rps = window.count() > 0.0
                 ? static_cast<double>(c.count) / window.count()
                 : 0.0,
      .duration = window,
  };
}

auto ThroughputTracker::stats(const std::string &label) const
    -> std::optional<ThroughputStats> {
  const auto now = Clock::now();
  std::lock_guard lock(mutex_);
  auto it = counters_.find(label);
  if (it == counters_.end()) {
    return std::nullopt;
  }
  return make_stats(label, it->second, now);
}

auto ThroughputTracker::all_stats() const -> std::vector<ThroughputStats> {
  const auto now = Clock::now();
  std::lock_guard lock(mutex_);
  std::vector<ThroughputStats> out;
  out.reserve(counters_.size());
  for (const auto &[label, c] : counters_) {
    out.push_back(make_stats(label, c, now));
  }
  return out;
}

auto ThroughputTracker::total_count() const -> std::uint64_t {
  std::lock_guard lock(mutex_);
  std::uint64_t total = 0;
  for (const auto &[label, c] : counters_) {
    total += c.count;
  }
  return total;
}

auto ThroughputTracker::total_throughput() const -> double {
  const auto now = Clock::now();
  std::lock_guard lock(mutex_);
  std::uint64_t total = 0;
  for (const auto &[label, c] : counters_) {
    total += c.count;
  }
  const std::chrono::duration<double> window = now - start_;
  return window.count() > 0.0 ? static_cast<double>(total) / window.count()
                              : 0.0;
}

void ThroughputTracker::reset() {
  std::lock_guard lock(mutex_);
  counters_.clear();
  start_ = Clock::now();
}

} // namespace loadcurve
