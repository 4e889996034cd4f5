/// @file outcome.cpp
/// @brief OutcomeCounters implementation.

#include "metrics/outcome.hpp"

#include <numeric>

namespace loadcurve {

auto OutcomeTotals::errors() const noexcept -> std::uint64_t {
  return std::accumulate(categories.begin(), categories.end(),
                         std::uint64_t{0});
}

void OutcomeCounters::on_request(const RequestOutcome &outcome) {
  requests_.fetch_add(1, std::memory_order_relaxed);
  if (outcome.category) {
    categories_[static_cast<std::size_t>(*outcome.category)].fetch_add(
        1, std::memory_order_relaxed);
  }
  if (!outcome.status) {
    transport_errors_.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  std::lock_guard lock(status_mutex_);
  ++status_codes_[*outcome.status];
}

void OutcomeCounters::on_scenario(const ScenarioOutcome &outcome) {
  scenarios_.fetch_add(1, std::memory_order_relaxed);
  if (outcome.success) {
    scenario_ok_.fetch_add(1, std::memory_order_relaxed);
  } else if (outcome.interrupted) {
    scenario_interrupted_.fetch_add(1, std::memory_order_relaxed);
  } else {
    scenario_failed_.fetch_add(1, std::memory_order_relaxed);
  }
}

auto OutcomeCounters::totals() const -> OutcomeTotals {
  OutcomeTotals t;
  t.requests = requests_.load(std::memory_order_relaxed);
  t.transport_errors = transport_errors_.load(std::memory_order_relaxed);
  for (std::size_t i = 0; i < kErrorCategoryCount; ++i) {
    t.categories[i] = categories_[i].load(std::memory_order_relaxed);
  }
  t.scenarios = scenarios_.load(std::memory_order_relaxed);
  t.scenario_successes = scenario_ok_.load(std::memory_order_relaxed);
  t.scenario_failures = scenario_failed_.load(std::memory_order_relaxed);
  t.scenario_interrupted = scenario_interrupted_.load(std::memory_order_relaxed);
  {
    std::lock_guard lock(status_mutex_);
    t.status_codes = status_codes_;
  }
  return t;
}

} // namespace loadcurve
