#pragma once
/// @file throughput_tracker.hpp
/// @brief Per-label request counters and rate statistics.

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loadcurve {

struct ThroughputStats {
  std::string label;
  std::uint64_t total_count = 0;
  double avg_time_ms = 0.0;
  double rps = 0.0; ///< total_count / time since the label's first sample.
  std::chrono::duration<double> duration{0};
};

/// @brief Thread-safe label → {count, total time, first/last sample time}.
class ThroughputTracker {
public:
  using Clock = std::chrono::steady_clock;

  ThroughputTracker();

  /// @brief Count one completed unit of work under @p label.
  void record(const std::string &label, std::chrono::nanoseconds elapsed);
  void record_ms(const std::string &label, double elapsed_ms);

  /// @brief Stats as of now, or nullopt for an unknown label.
  [[nodiscard]] auto stats(const std::string &label) const
      -> std::optional<ThroughputStats>;

  /// @brief Every label's stats, sorted by label.
  [[nodiscard]] auto all_stats() const -> std::vector<ThroughputStats>;

  /// @brief All samples divided by the time since construction or reset().
  [[nodiscard]] auto total_throughput() const -> double;

  [[nodiscard]] auto total_count() const -> std::uint64_t;

  void reset();

private:
  struct Counter {
    std::uint64_t count = 0;
    double total_ms = 0.0;
    Clock::time_point first;
    Clock::time_point last;
  };

  [[nodiscard]] static auto make_stats(const std::string &label,
                                       const Counter &c, Clock::time_point now)
      -> ThroughputStats;

  mutable std::mutex mutex_;
  std::map<std::string, Counter> counters_; ///< Ordered for reporting.
  Clock::time_point start_;
};

} // namespace loadcurve
