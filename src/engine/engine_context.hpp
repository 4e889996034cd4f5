#pragma once
/// @file engine_context.hpp
/// @brief Process-wide shared state, created once and handed to every
///        worker and to the memory guard by shared_ptr.

#include "metrics/latency_tracker.hpp"
#include "metrics/outcome.hpp"
#include "metrics/throughput_tracker.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace loadcurve {

class EngineContext {
public:
  explicit EngineContext(
      std::size_t max_labels = MultiLabelLatencyTracker::kDefaultMaxLabels,
      std::shared_ptr<OutcomeSink> external_sink = nullptr);

  EngineContext(const EngineContext &) = delete;
  EngineContext &operator=(const EngineContext &) = delete;

  [[nodiscard]] static auto
  create(std::size_t max_labels = MultiLabelLatencyTracker::kDefaultMaxLabels,
         std::shared_ptr<OutcomeSink> external_sink = nullptr)
      -> std::shared_ptr<EngineContext>;

  // ─── Tracking flag ──────────────────────────────────────────────────

  /// @brief Whether latency samples should be recorded.
  [[nodiscard]] auto tracking_active() const noexcept -> bool {
    return tracking_active_.load(std::memory_order_relaxed);
  }

  /// @brief One-way: once off, latency tracking stays off for the process.
  void disable_tracking() noexcept {
    tracking_active_.store(false, std::memory_order_relaxed);
  }

  /// @brief Start with tracking off (percentiles disabled by config).
  void set_initial_tracking(bool enabled) noexcept {
    tracking_active_.store(enabled, std::memory_order_relaxed);
  }

  /// @brief Rotate every latency histogram.
  void rotate_histograms();

  // ─── Trackers ───────────────────────────────────────────────────────

  [[nodiscard]] auto request_latency() noexcept -> MultiLabelLatencyTracker & {
    return request_latency_;
  }
  [[nodiscard]] auto scenario_latency() noexcept
      -> MultiLabelLatencyTracker & {
    return scenario_latency_;
  }
  [[nodiscard]] auto step_latency() noexcept -> MultiLabelLatencyTracker & {
    return step_latency_;
  }
  [[nodiscard]] auto throughput() noexcept -> ThroughputTracker & {
    return throughput_;
  }
  [[nodiscard]] auto counters() const noexcept -> const OutcomeCounters & {
    return counters_;
  }

  /// @brief Deterministic sampling: admits @p rate_percent of calls.
  ///
  /// A shared counter walks 0..99; a call is admitted when its slot is below
  /// the rate, so any 100 consecutive calls admit exactly rate_percent.
  [[nodiscard]] auto should_sample(unsigned rate_percent) noexcept -> bool {
    if (rate_percent >= 100) {
      return true;
    }
    const auto slot = sample_counter_.fetch_add(1, std::memory_order_relaxed);
    return slot % 100 < rate_percent;
  }

  /// @brief Samples dropped because tracking was off.
  [[nodiscard]] auto skipped_samples() const noexcept -> std::uint64_t {
    return skipped_.load(std::memory_order_relaxed);
  }
  void note_skipped() noexcept {
    skipped_.fetch_add(1, std::memory_order_relaxed);
  }

  // ─── Outcome events ─────────────────────────────────────────────────

  void emit(const RequestOutcome &outcome);
  void emit(const ScenarioOutcome &outcome);

private:
  std::atomic<bool> tracking_active_{true};
  std::atomic<std::uint64_t> skipped_{0};
  std::atomic<std::uint64_t> sample_counter_{0};

  MultiLabelLatencyTracker request_latency_;
  MultiLabelLatencyTracker scenario_latency_;
  MultiLabelLatencyTracker step_latency_;
  ThroughputTracker throughput_;
  OutcomeCounters counters_;
  std::shared_ptr<OutcomeSink> external_sink_;
};

} // namespace loadcurve
