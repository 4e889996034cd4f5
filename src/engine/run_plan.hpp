#pragma once
/// @file run_plan.hpp
/// @brief Everything a run needs, resolved from configuration.

#include "guard/memory_guard.hpp"
#include "http/http_client.hpp"
#include "load/rate_model.hpp"
#include "scenario/scenario.hpp"
#include "scenario/scenario_selector.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace loadcurve {

/// @brief Immutable run description. Shared as shared_ptr<const RunPlan>.
///
/// Exactly one of @ref request (bare mode) or @ref selector (scenario mode)
/// drives the workers; when both are present scenarios win.
struct RunPlan {
  std::string base_url = "http://localhost:8080";
  std::size_t workers = 10;
  Seconds duration{60};
  std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
  unsigned sampling_rate = 100; ///< Percent of latency samples recorded.
  bool percentiles = true;      ///< Initial state of latency tracking.

  LoadModel load = ConcurrentModel{};
  MemoryGuardConfig guard;

  std::optional<RequestConfig> request;
  std::optional<ScenarioSelector> selector;

  [[nodiscard]] auto scenario_mode() const noexcept -> bool {
    return selector.has_value();
  }
};

} // namespace loadcurve
