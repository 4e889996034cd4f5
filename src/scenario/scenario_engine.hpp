#pragma once
/// @file scenario_engine.hpp
/// @brief Executes a Scenario's steps in order against an HttpClient.

#include "core/errors.hpp"
#include "http/http_client.hpp"
#include "scenario/scenario.hpp"
#include "scenario/session_store.hpp"
#include "scenario/variable_context.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loadcurve {

/// @brief Outcome of one step. Immutable once produced.
struct StepResult {
  std::string name;
  bool success = false;
  std::optional<std::uint16_t> status;   ///< Unset on transport failure.
  double elapsed_ms = 0.0;               ///< Send to full response; no think time.
  std::optional<std::string> error;      ///< Transport error text only.
  std::optional<TransportError> transport_error;
  std::size_t assertions_passed = 0;
  std::size_t assertions_failed = 0;
  std::vector<AssertionFailure> failures;
};

/// @brief Outcome of one scenario execution. Immutable once produced.
struct ScenarioResult {
  std::string scenario_name;
  bool success = false;
  double total_elapsed_ms = 0.0;
  std::size_t steps_completed = 0; ///< Steps attempted, failing one included.
  std::optional<std::size_t> failed_at_step;
  /// Set when the test deadline passed between steps and the rest were
  /// skipped. Such a run is neither a success nor a step failure.
  bool interrupted = false;
  std::vector<StepResult> steps;
};

struct ScenarioEngineConfig {
  std::string base_url;
  std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
};

/// @brief Stateless step runner; safe to share between workers.
///
/// Per execution state lives in the VariableContext and SessionStore the
/// caller passes in.
class ScenarioEngine {
public:
  using Clock = std::chrono::steady_clock;

  ScenarioEngine(std::shared_ptr<HttpClient> client, ScenarioEngineConfig cfg);

  /// @brief Run every step in order, stopping at the first failure.
  /// @param deadline Optional test deadline, checked between steps.
  [[nodiscard]] auto
  execute(const Scenario &scenario, VariableContext &context,
          SessionStore &session,
          std::optional<Clock::time_point> deadline = std::nullopt) const
      -> net::awaitable<ScenarioResult>;

  /// @brief Send one step and evaluate it; no think time.
  [[nodiscard]] auto execute_step(const Step &step, VariableContext &context,
                                  SessionStore &session) const
      -> net::awaitable<StepResult>;

  /// @brief Resolve placeholders and attach session cookies.
  [[nodiscard]] auto build_request(const RequestConfig &request,
                                   const VariableContext &context,
                                   const SessionStore &session) const
      -> HttpRequest;

  [[nodiscard]] auto config() const noexcept -> const ScenarioEngineConfig & {
    return cfg_;
  }

private:
  std::shared_ptr<HttpClient> client_;
  ScenarioEngineConfig cfg_;
};

} // namespace loadcurve
