/// @file latency_tracker.cpp
/// @brief Log-linear histogram and label-capped tracker map.

#include "metrics/latency_tracker.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <iostream>

namespace loadcurve {

struct LatencyTracker::Buckets {
  std::array<std::atomic<std::uint64_t>, kBucketCount> counts{};
};

namespace {

template <typename T> void store_min(std::atomic<T> &target, T value) {
  T cur = target.load(std::memory_order_relaxed);
  while (value < cur &&
         !target.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {
  }
}

template <typename T> void store_max(std::atomic<T> &target, T value) {
  T cur = target.load(std::memory_order_relaxed);
  while (value > cur &&
         !target.compare_exchange_weak(cur, value, std::memory_order_relaxed)) {
  }
}

} // namespace

// ─── Bucket math ────────────────────────────────────────────────────────

auto LatencyTracker::bucket_index(std::uint64_t micros) noexcept
    -> std::size_t {
  if (micros < kLinearBuckets) {
    return static_cast<std::size_t>(micros);
  }
  const auto msb = static_cast<unsigned>(std::bit_width(micros)) - 1; // >= 8
  const unsigned shift = msb - 7;
  const auto mantissa = static_cast<std::size_t>(micros >> shift); // 128..255
  return kLinearBuckets + (shift - 1) * kSubBuckets + (mantissa - kSubBuckets);
}

auto LatencyTracker::bucket_lower(std::size_t index) noexcept
    -> std::uint64_t {
  if (index < kLinearBuckets) {
    return index;
  }
  const auto rel = index - kLinearBuckets;
  const auto shift = rel / kSubBuckets + 1;
  const auto mantissa = rel % kSubBuckets + kSubBuckets;
  return static_cast<std::uint64_t>(mantissa) << shift;
}

auto LatencyTracker::bucket_width(std::size_t index) noexcept
    -> std::uint64_t {
  if (index < kLinearBuckets) {
    return 1;
  }
  const auto shift = (index - kLinearBuckets) / kSubBuckets + 1;
  return std::uint64_t{1} << shift;
}

// ─── LatencyTracker ─────────────────────────────────────────────────────

LatencyTracker::LatencyTracker() : buckets_{std::make_unique<Buckets>()} {}

LatencyTracker::~LatencyTracker() = default;

void LatencyTracker::record_us(std::uint64_t micros) {
  const auto v = std::clamp(micros, kMinUs, kMaxUs);

  std::shared_lock lock(mutex_);
  buckets_->counts[bucket_index(v)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_.fetch_add(v, std::memory_order_relaxed);
  store_min(min_, v);
  store_max(max_, v);
}

void LatencyTracker::record_ms(double millis) {
  if (!(millis > 0.0)) {
    record_us(kMinUs);
    return;
  }
  const double us = std::min(millis * 1000.0, static_cast<double>(kMaxUs));
  record_us(static_cast<std::uint64_t>(std::llround(us)));
}

void LatencyTracker::record(std::chrono::nanoseconds latency) {
  const auto us =
      std::chrono::duration_cast<std::chrono::microseconds>(latency).count();
  record_us(us > 0 ? static_cast<std::uint64_t>(us) : kMinUs);
}

auto LatencyTracker::count() const noexcept -> std::uint64_t {
  return count_.load(std::memory_order_relaxed);
}

auto LatencyTracker::percentile_locked(double p, std::uint64_t total) const
    -> std::uint64_t {
  if (total == 0) {
    return 0;
  }
  const double clamped = std::clamp(p, 0.0, 100.0);
  auto rank = static_cast<std::uint64_t>(
      std::ceil(clamped / 100.0 * static_cast<double>(total)));
  rank = std::clamp<std::uint64_t>(rank, 1, total);

  std::uint64_t seen = 0;
  for (std::size_t i = 0; i < kBucketCount; ++i) {
    seen += buckets_->counts[i].load(std::memory_order_relaxed);
    if (seen >= rank) {
      const auto mid = bucket_lower(i) + bucket_width(i) / 2;
      return std::clamp(mid, min_.load(std::memory_order_relaxed),
                        max_.load(std::memory_order_relaxed));
    }
  }
  return max_.load(std::memory_order_relaxed);
}

auto LatencyTracker::percentile(double p) const -> std::uint64_t {
  std::unique_lock lock(mutex_);
  return percentile_locked(p, count_.load(std::memory_order_relaxed));
}

auto LatencyTracker::stats() const -> std::optional<LatencyStats> {
  // Exclusive so the percentile walk sees a consistent bucket array.
  std::unique_lock lock(mutex_);
  const auto total = count_.load(std::memory_order_relaxed);
  if (total == 0) {
    return std::nullopt;
  }

  return LatencyStats{
      .count = total,
      .min_us = min_.load(std::memory_order_relaxed),
      .max_us = max_.load(std::memory_order_relaxed),
      .mean_us = static_cast<double>(sum_.load(std::memory_order_relaxed)) /
                 static_cast<double>(total),
      .p50_us = percentile_locked(50.0, total),
      .p90_us = percentile_locked(90.0, total),
      .p95_us = percentile_locked(95.0, total),
      .p99_us = percentile_locked(99.0, total),
      .p99_9_us = percentile_locked(99.9, total),
  };
}

void LatencyTracker::clear_locked() {
  count_.store(0, std::memory_order_relaxed);
  sum_.store(0, std::memory_order_relaxed);
  min_.store(UINT64_MAX, std::memory_order_relaxed);
  max_.store(0, std::memory_order_relaxed);
}

void LatencyTracker::reset() {
  std::unique_lock lock(mutex_);
  for (auto &c : buckets_->counts) {
    c.store(0, std::memory_order_relaxed);
  }
  clear_locked();
}

void LatencyTracker::rotate() {
  auto fresh = std::make_unique<Buckets>();
  std::unique_ptr<Buckets> old;
  {
    std::unique_lock lock(mutex_);
    old = std::exchange(buckets_, std::move(fresh));
    clear_locked();
  }
  // `old` is freed here, outside the lock.
}

auto LatencyTracker::footprint_bytes() noexcept -> std::size_t {
  return sizeof(Buckets);
}

// ─── MultiLabelLatencyTracker ───────────────────────────────────────────

MultiLabelLatencyTracker::MultiLabelLatencyTracker(std::string name,
                                                   std::size_t max_labels)
    : name_{std::move(name)}, max_labels_{std::max<std::size_t>(max_labels, 1)} {}

auto MultiLabelLatencyTracker::acquire(const std::string &label)
    -> TrackerPtr {
  std::lock_guard lock(mutex_);

  if (auto it = trackers_.find(label); it != trackers_.end()) {
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return it->second.tracker;
  }

  if (trackers_.size() >= max_labels_) {
    const auto &victim = lru_.back();
    trackers_.erase(victim);
    lru_.pop_back();
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }

  lru_.push_front(label);
  auto tracker = std::make_shared<LatencyTracker>();
  trackers_.emplace(label, Entry{tracker, lru_.begin()});

  const auto warn_at = (max_labels_ * 8 + 9) / 10;
  if (!warned_ && trackers_.size() >= warn_at) {
    warned_ = true;
    std::cerr << "[Metrics] " << name_ << ": " << trackers_.size()
              << " labels in use (cap " << max_labels_
              << "); least recently used labels will be evicted\n";
  }
  return tracker;
}

void MultiLabelLatencyTracker::record(const std::string &label,
                                      double millis) {
  acquire(label)->record_ms(millis);
}

void MultiLabelLatencyTracker::record_us(const std::string &label,
                                         std::uint64_t micros) {
  acquire(label)->record_us(micros);
}

auto MultiLabelLatencyTracker::stats(const std::string &label) const
    -> std::optional<LatencyStats> {
  TrackerPtr tracker;
  {
    std::lock_guard lock(mutex_);
    auto it = trackers_.find(label);
    if (it == trackers_.end()) {
      return std::nullopt;
    }
    tracker = it->second.tracker;
  }
  return tracker->stats();
}

auto MultiLabelLatencyTracker::all_stats() const
    -> std::vector<std::pair<std::string, LatencyStats>> {
  std::vector<std::pair<std::string, TrackerPtr>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.reserve(trackers_.size());
    for (const auto &[label, entry] : trackers_) {
      snapshot.emplace_back(label, entry.tracker);
    }
  }

  std::vector<std::pair<std::string, LatencyStats>> out;
  out.reserve(snapshot.size());
  for (auto &[label, tracker] : snapshot) {
    if (auto s = tracker->stats()) {
      out.emplace_back(std::move(label), *s);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  return out;
}

auto MultiLabelLatencyTracker::labels() const -> std::vector<std::string> {
  std::vector<std::string> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(trackers_.size());
    for (const auto &[label, entry] : trackers_) {
      out.push_back(label);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

auto MultiLabelLatencyTracker::label_count() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return trackers_.size();
}

auto MultiLabelLatencyTracker::evictions() const noexcept -> std::uint64_t {
  return evictions_.load(std::memory_order_relaxed);
}

void MultiLabelLatencyTracker::rotate() {
  std::vector<TrackerPtr> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.reserve(trackers_.size());
    for (const auto &[label, entry] : trackers_) {
      snapshot.push_back(entry.tracker);
    }
  }
  for (auto &t : snapshot) {
    t->rotate();
  }
}

void MultiLabelLatencyTracker::reset_all() {
  std::lock_guard lock(mutex_);
  trackers_.clear();
  lru_.clear();
  warned_ = false;
}

} // namespace loadcurve
