/// @file engine_context.cpp
/// @brief EngineContext implementation.

#include "engine/engine_context.hpp"

namespace loadcurve {

EngineContext::EngineContext(std::size_t max_labels,
                             std::shared_ptr<OutcomeSink> external_sink)
    : request_latency_{"request", max_labels},
      scenario_latency_{"scenario", max_labels},
      step_latency_{"step", max_labels},
      external_sink_{std::move(external_sink)} {}

auto EngineContext::create(std::size_t max_labels,
                           std::shared_ptr<OutcomeSink> external_sink)
    -> std::shared_ptr<EngineContext> {
  return std::make_shared<EngineContext>(max_labels, std::move(external_sink));
}

void EngineContext::rotate_histograms() {
  request_latency_.rotate();
  scenario_latency_.rotate();
  step_latency_.rotate();
}

void EngineContext::emit(const RequestOutcome &outcome) {
  counters_.on_request(outcome);
  if (external_sink_) {
    external_sink_->on_request(outcome);
  }
}

void EngineContext::emit(const ScenarioOutcome &outcome) {
  counters_.on_scenario(outcome);
  if (external_sink_) {
    external_sink_->on_scenario(outcome);
  }
}

} // namespace loadcurve
