/// @file rate_model.cpp
/// @brief Rate-curve evaluation, validation and pacing conversion.

#include "load/rate_model.hpp"
#include "core/overloaded.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <sstream>

namespace loadcurve {

namespace {

auto lerp(double from, double to, double elapsed, double span) noexcept
    -> double {
  if (span <= 0.0) {
    return to;
  }
  return from + (to - from) * (elapsed / span);
}

auto ramp_rate(const RampRpsModel &m, double elapsed) noexcept -> double {
  const double ramp = m.ramp_duration.count();
  if (ramp <= 0.0) {
    return m.max;
  }
  const double progress = std::clamp(elapsed / ramp, 0.0, 1.0);
  return m.min + (m.max - m.min) * progress;
}

auto daily_rate(const DailyTrafficModel &m, double elapsed) noexcept
    -> double {
  const double cycle = m.cycle_duration.count();
  if (cycle <= 0.0) {
    return m.max;
  }

  const double t = std::fmod(std::max(elapsed, 0.0), cycle);

  const double morning_end = cycle * m.ratios[0];
  const double peak_end = morning_end + cycle * m.ratios[1];
  const double decline_end = peak_end + cycle * m.ratios[2];
  const double mid_end = decline_end + cycle * m.ratios[3];
  const double evening_end = mid_end + cycle * m.ratios[4];

  if (t < morning_end) {
    return lerp(m.min, m.max, t, morning_end);
  }
  if (t < peak_end) {
    return m.max;
  }
  if (t < decline_end) {
    return lerp(m.max, m.mid, t - peak_end, decline_end - peak_end);
  }
  if (t < mid_end) {
    return m.mid;
  }
  if (t < evening_end) {
    return lerp(m.mid, m.min, t - mid_end, evening_end - mid_end);
  }
  return m.min; // Night.
}

auto negative(double v) -> bool { return v < 0.0 || std::isnan(v); }

} // namespace

auto current_rate(const LoadModel &model, double elapsed_secs,
                  double /*total_duration_secs*/) noexcept -> double {
  return std::visit(
      overloaded{
          [](const ConcurrentModel &) {
            return std::numeric_limits<double>::infinity();
          },
          [](const RpsModel &m) { return m.target; },
          [&](const RampRpsModel &m) { return ramp_rate(m, elapsed_secs); },
          [&](const DailyTrafficModel &m) {
            return daily_rate(m, elapsed_secs);
          },
      },
      model);
}

auto validate(const LoadModel &model)
    -> std::expected<std::vector<std::string>, ConfigError> {
  std::vector<std::string> warnings;

  if (const auto *rps = std::get_if<RpsModel>(&model)) {
    if (negative(rps->target)) {
      return std::unexpected(ConfigError{"load.target", "must be >= 0"});
    }
  } else if (const auto *ramp = std::get_if<RampRpsModel>(&model)) {
    if (negative(ramp->min) || negative(ramp->max)) {
      return std::unexpected(ConfigError{"load.min/max", "must be >= 0"});
    }
    if (negative(ramp->ramp_duration.count())) {
      return std::unexpected(
          ConfigError{"load.rampDuration", "must be non-negative"});
    }
    if (ramp->min > ramp->max) {
      warnings.emplace_back("ramp min exceeds max; the curve will decline");
    }
  } else if (const auto *daily = std::get_if<DailyTrafficModel>(&model)) {
    if (negative(daily->min) || negative(daily->mid) || negative(daily->max)) {
      return std::unexpected(
          ConfigError{"load.min/mid/max", "must be >= 0"});
    }
    if (negative(daily->cycle_duration.count())) {
      return std::unexpected(
          ConfigError{"load.cycleDuration", "must be non-negative"});
    }
    for (auto r : daily->ratios) {
      if (negative(r)) {
        return std::unexpected(ConfigError{"load.ratios", "must be >= 0"});
      }
    }
    const double sum =
        std::accumulate(daily->ratios.begin(), daily->ratios.end(), 0.0);
    if (sum > 1.0) {
      std::ostringstream ss;
      ss << "daily traffic ratios sum to " << sum
         << " (> 1.0); the night phase is skipped and later phases are "
            "truncated at the cycle boundary";
      warnings.push_back(ss.str());
    }
  }

  return warnings;
}

auto describe(const LoadModel &model) -> std::string {
  std::ostringstream ss;
  std::visit(overloaded{
                 [&](const ConcurrentModel &) { ss << "Concurrent"; },
                 [&](const RpsModel &m) { ss << "Rps(" << m.target << ")"; },
                 [&](const RampRpsModel &m) {
                   ss << "RampRps(" << m.min << " -> " << m.max << " over "
                      << m.ramp_duration.count() << "s)";
                 },
                 [&](const DailyTrafficModel &m) {
                   ss << "DailyTraffic(min=" << m.min << ", mid=" << m.mid
                      << ", max=" << m.max
                      << ", cycle=" << m.cycle_duration.count() << "s)";
                 },
             },
             model);
  return ss.str();
}

auto pacing_delay(double rate, std::size_t workers) noexcept
    -> std::optional<std::chrono::milliseconds> {
  if (std::isinf(rate)) {
    return std::chrono::milliseconds{0};
  }
  if (!(rate > 0.0)) {
    return std::nullopt;
  }
  const double ms =
      std::round(static_cast<double>(workers) * 1000.0 / rate);
  const double cap = static_cast<double>(
      std::chrono::duration_cast<std::chrono::milliseconds>(kParkInterval)
          .count());
  return std::chrono::milliseconds{
      static_cast<std::int64_t>(std::min(ms, cap))};
}

} // namespace loadcurve
