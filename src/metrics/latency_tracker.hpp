#pragma once
/// @file latency_tracker.hpp
/// @brief Concurrent latency histograms with percentile extraction.
///
/// Samples are bucketed log-linearly: exact below 256 µs, then 128
/// sub-buckets per power of two, which bounds the relative error of any
/// reported percentile to 1/128 (< 0.8 %). Recording is lock-free apart from
/// a shared lock that only rotate()/reset() take exclusively.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loadcurve {

/// @brief Percentile summary in microseconds.
struct LatencyStats {
  std::uint64_t count = 0;
  std::uint64_t min_us = 0;
  std::uint64_t max_us = 0;
  double mean_us = 0.0;
  std::uint64_t p50_us = 0;
  std::uint64_t p90_us = 0;
  std::uint64_t p95_us = 0;
  std::uint64_t p99_us = 0;
  std::uint64_t p99_9_us = 0;
};

/// @brief Single-label latency histogram.
class LatencyTracker {
public:
  static constexpr std::uint64_t kMinUs = 1;
  static constexpr std::uint64_t kMaxUs = 60'000'000; ///< 60 s.

  LatencyTracker();
  ~LatencyTracker();

  LatencyTracker(const LatencyTracker &) = delete;
  LatencyTracker &operator=(const LatencyTracker &) = delete;

  /// @brief Record one sample; values are clamped to [kMinUs, kMaxUs].
  void record_us(std::uint64_t micros);
  void record_ms(double millis);
  void record(std::chrono::nanoseconds latency);

  /// @brief Summary, or nullopt when no samples are held.
  [[nodiscard]] auto stats() const -> std::optional<LatencyStats>;

  /// @brief Value at percentile @p p (0–100), or 0 when empty.
  [[nodiscard]] auto percentile(double p) const -> std::uint64_t;

  [[nodiscard]] auto count() const noexcept -> std::uint64_t;

  /// @brief Drop all samples.
  void reset();

  /// @brief Drop all samples and release the bucket storage, replacing it
  ///        with a fresh zeroed array. Used by the memory guard.
  void rotate();

  /// @brief Bytes held by the bucket array.
  [[nodiscard]] static auto footprint_bytes() noexcept -> std::size_t;

  // ─── Bucket math (exposed for tests) ───────────────────────────────────

  static constexpr std::size_t kLinearBuckets = 256;
  static constexpr std::size_t kSubBuckets = 128;
  static constexpr std::size_t kBucketCount = kLinearBuckets + 18 * kSubBuckets;

  [[nodiscard]] static auto bucket_index(std::uint64_t micros) noexcept
      -> std::size_t;
  /// @brief Lowest value that maps to @p index.
  [[nodiscard]] static auto bucket_lower(std::size_t index) noexcept
      -> std::uint64_t;
  /// @brief Width of bucket @p index.
  [[nodiscard]] static auto bucket_width(std::size_t index) noexcept
      -> std::uint64_t;

private:
  struct Buckets;

  void clear_locked();
  [[nodiscard]] auto percentile_locked(double p, std::uint64_t total) const
      -> std::uint64_t;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<Buckets> buckets_;
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_{0};
  std::atomic<std::uint64_t> min_{UINT64_MAX};
  std::atomic<std::uint64_t> max_{0};
};

/// @brief Label → LatencyTracker with a bounded label set.
///
/// When a new label would exceed the cap the least recently recorded label
/// is evicted. A warning is logged once when the label count reaches 80 % of
/// the cap.
class MultiLabelLatencyTracker {
public:
  static constexpr std::size_t kDefaultMaxLabels = 100;

  explicit MultiLabelLatencyTracker(std::string name = "latency",
                                    std::size_t max_labels = kDefaultMaxLabels);

  void record(const std::string &label, double millis);
  void record_us(const std::string &label, std::uint64_t micros);

  [[nodiscard]] auto stats(const std::string &label) const
      -> std::optional<LatencyStats>;

  /// @brief Every label with samples, sorted by label.
  [[nodiscard]] auto all_stats() const
      -> std::vector<std::pair<std::string, LatencyStats>>;

  /// @brief Labels in sorted order.
  [[nodiscard]] auto labels() const -> std::vector<std::string>;

  [[nodiscard]] auto label_count() const -> std::size_t;
  [[nodiscard]] auto evictions() const noexcept -> std::uint64_t;
  [[nodiscard]] auto max_labels() const noexcept -> std::size_t {
    return max_labels_;
  }

  /// @brief Rotate every label's histogram, keeping the labels.
  void rotate();

  /// @brief Forget every label.
  void reset_all();

private:
  using TrackerPtr = std::shared_ptr<LatencyTracker>;
  struct Entry {
    TrackerPtr tracker;
    std::list<std::string>::iterator lru_pos;
  };

  auto acquire(const std::string &label) -> TrackerPtr;

  std::string name_;
  std::size_t max_labels_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> trackers_;
  std::list<std::string> lru_; ///< Front = most recently used.
  bool warned_ = false;
  std::atomic<std::uint64_t> evictions_{0};
};

} // namespace loadcurve
