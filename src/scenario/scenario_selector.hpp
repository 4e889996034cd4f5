#pragma once
/// @file scenario_selector.hpp
/// @brief Weighted random choice among the scenarios of a mix.

#include "core/errors.hpp"
#include "scenario/scenario.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <vector>

namespace loadcurve {

using ScenarioPtr = std::shared_ptr<const Scenario>;

/// @brief Picks a scenario with probability weight / Σweight.
///
/// Immutable after construction; select() is safe from any thread.
class ScenarioSelector {
public:
  /// @brief Fails on an empty list or any weight that is not > 0.
  [[nodiscard]] static auto create(std::vector<ScenarioPtr> scenarios)
      -> std::expected<ScenarioSelector, ConfigError>;

  /// @brief Random pick using a per-thread generator.
  [[nodiscard]] auto select() const -> const ScenarioPtr &;

  /// @brief Deterministic pick for a point @p u in [0, 1).
  [[nodiscard]] auto select_at(double u) const -> const ScenarioPtr &;

  [[nodiscard]] auto scenarios() const noexcept
      -> const std::vector<ScenarioPtr> & {
    return scenarios_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return scenarios_.size();
  }
  [[nodiscard]] auto total_weight() const noexcept -> double {
    return total_;
  }

private:
  ScenarioSelector(std::vector<ScenarioPtr> scenarios,
                   std::vector<double> cumulative);

  std::vector<ScenarioPtr> scenarios_;
  std::vector<double> cumulative_;
  double total_ = 0.0;
};

} // namespace loadcurve
