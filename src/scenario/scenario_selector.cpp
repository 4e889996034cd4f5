/// @file scenario_selector.cpp
/// @brief Cumulative-weight scenario selection.

#include "scenario/scenario_selector.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace loadcurve {

namespace {

auto &rng() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

} // namespace

ScenarioSelector::ScenarioSelector(std::vector<ScenarioPtr> scenarios,
                                   std::vector<double> cumulative)
    : scenarios_{std::move(scenarios)}, cumulative_{std::move(cumulative)},
      total_{cumulative_.back()} {}

auto ScenarioSelector::create(std::vector<ScenarioPtr> scenarios)
    -> std::expected<ScenarioSelector, ConfigError> {
  if (scenarios.empty()) {
    return std::unexpected(
        ConfigError{"scenarios", "at least one scenario is required"});
  }

  std::vector<double> cumulative;
  cumulative.reserve(scenarios.size());
  double running = 0.0;
  for (const auto &s : scenarios) {
    if (!s) {
      return std::unexpected(ConfigError{"scenarios", "null scenario"});
    }
    if (!(s->weight > 0.0) || std::isinf(s->weight)) {
      return std::unexpected(ConfigError{
          "scenarios." + s->name + ".weight", "must be a finite value > 0"});
    }
    running += s->weight;
    cumulative.push_back(running);
  }

  return ScenarioSelector{std::move(scenarios), std::move(cumulative)};
}

auto ScenarioSelector::select() const -> const ScenarioPtr & {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return select_at(dist(rng()));
}

auto ScenarioSelector::select_at(double u) const -> const ScenarioPtr & {
  const double point = std::clamp(u, 0.0, 1.0) * total_;
  auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), point);
  if (it == cumulative_.end()) {
    return scenarios_.back();
  }
  return scenarios_[static_cast<std::size_t>(it - cumulative_.begin())];
}

} // namespace loadcurve
