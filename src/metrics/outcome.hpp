#pragma once
/// @file outcome.hpp
/// @brief Per-request and per-scenario outcome events, and the built-in
///        counting sink used by the end-of-run report.

#include "core/errors.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loadcurve {

/// @brief One HTTP exchange (a bare request or one scenario step).
struct RequestOutcome {
  std::string label;                     ///< Request path or "scenario:step".
  std::optional<std::uint16_t> status;   ///< Unset on transport failure.
  std::optional<ErrorCategory> category; ///< Unset for 1xx–3xx.
  double elapsed_ms = 0.0;
};

/// @brief One scenario execution.
struct ScenarioOutcome {
  std::string scenario_name;
  bool success = false;
  bool interrupted = false;
  double total_elapsed_ms = 0.0;
  std::optional<std::size_t> failed_at_step;
  std::vector<std::pair<std::string, double>> step_elapsed_ms;
};

/// @brief Receiver of outcome events. Called concurrently from all workers.
class OutcomeSink {
public:
  virtual ~OutcomeSink() = default;

  virtual void on_request(const RequestOutcome &outcome) = 0;
  virtual void on_scenario(const ScenarioOutcome &outcome) = 0;
};

/// @brief Totals snapshot from OutcomeCounters.
struct OutcomeTotals {
  std::uint64_t requests = 0;
  std::uint64_t transport_errors = 0;
  std::map<std::uint16_t, std::uint64_t> status_codes;
  std::array<std::uint64_t, kErrorCategoryCount> categories{};
  std::uint64_t scenarios = 0;
  std::uint64_t scenario_successes = 0;
  std::uint64_t scenario_failures = 0;
  std::uint64_t scenario_interrupted = 0;

  [[nodiscard]] auto errors() const noexcept -> std::uint64_t;
};

/// @brief Thread-safe counting sink.
class OutcomeCounters final : public OutcomeSink {
public:
  void on_request(const RequestOutcome &outcome) override;
  void on_scenario(const ScenarioOutcome &outcome) override;

  [[nodiscard]] auto totals() const -> OutcomeTotals;

private:
  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> transport_errors_{0};
  std::array<std::atomic<std::uint64_t>, kErrorCategoryCount> categories_{};
  std::atomic<std::uint64_t> scenarios_{0};
  std::atomic<std::uint64_t> scenario_ok_{0};
  std::atomic<std::uint64_t> scenario_failed_{0};
  std::atomic<std::uint64_t> scenario_interrupted_{0};

  mutable std::mutex status_mutex_;
  std::map<std::uint16_t, std::uint64_t> status_codes_;
};

} // namespace loadcurve
