#pragma once
/// @file rate_model.hpp
/// @brief Temporal rate curves: map elapsed test time to the aggregate
///        requests-per-second target for the whole process.

#include "core/errors.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace loadcurve {

using Seconds = std::chrono::duration<double>;

/// @brief No rate limit: every worker fires back-to-back.
struct ConcurrentModel {};

/// @brief Constant target rate.
struct RpsModel {
  double target = 0.0;
};

/// @brief Linear ramp from min to max over ramp_duration, then hold at max.
struct RampRpsModel {
  double min = 0.0;
  double max = 0.0;
  Seconds ramp_duration{0};
};

/// @brief Repeating five-phase day curve plus an implicit night phase.
///
/// Phase lengths are `ratios[i] * cycle_duration`, in order: morning ramp
/// (min→max), peak sustain (max), mid decline (max→mid), mid sustain (mid),
/// evening decline (mid→min). Whatever is left of the cycle is spent at min.
struct DailyTrafficModel {
  double min = 0.0;
  double mid = 0.0;
  double max = 0.0;
  Seconds cycle_duration{0};
  std::array<double, 5> ratios{0.1, 0.2, 0.1, 0.2, 0.1};
};

using LoadModel =
    std::variant<ConcurrentModel, RpsModel, RampRpsModel, DailyTrafficModel>;

/// @brief Target aggregate rate at @p elapsed_secs into the test.
///
/// Pure and deterministic. ConcurrentModel returns +infinity.
/// @param model               The curve.
/// @param elapsed_secs        Seconds since the shared start time.
/// @param total_duration_secs Test duration (reserved for duration-relative
///                            curves; unused by the current models).
[[nodiscard]] auto current_rate(const LoadModel &model, double elapsed_secs,
                                double total_duration_secs) noexcept
    -> double;

/// @brief Check parameters before the test starts.
/// @return Non-fatal warnings (e.g. daily ratios summing past 1.0), or a
///         ConfigError for values that cannot produce a valid curve.
[[nodiscard]] auto validate(const LoadModel &model)
    -> std::expected<std::vector<std::string>, ConfigError>;

/// @brief One-line description for the startup banner.
[[nodiscard]] auto describe(const LoadModel &model) -> std::string;

/// @brief How long a worker parks when the target rate is zero.
inline constexpr std::chrono::hours kParkInterval{1};

/// @brief Per-worker pacing delay in whole milliseconds.
///
/// `round(workers * 1000 / rate)`. Returns 0 for an infinite rate (burst) and
/// nullopt for a non-positive rate (the worker should park). Delays longer
/// than kParkInterval are capped to it.
[[nodiscard]] auto pacing_delay(double rate, std::size_t workers) noexcept
    -> std::optional<std::chrono::milliseconds>;

} // namespace loadcurve
