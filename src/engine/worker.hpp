#pragma once
/// @file worker.hpp
/// @brief One virtual user: paces itself to its share of the aggregate rate
///        and runs bare requests or scenarios until the deadline.

#include "engine/config_channel.hpp"
#include "engine/engine_context.hpp"
#include "http/http_client.hpp"
#include "scenario/scenario_engine.hpp"
#include "scenario/session_store.hpp"

#include <bitset>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace loadcurve {

/// @brief Fixed per-run scheduling parameters for one worker.
struct WorkerConfig {
  std::size_t id = 0;
  std::size_t worker_count = 1;
  std::chrono::steady_clock::time_point start;
  std::chrono::steady_clock::time_point deadline;
};

/// @brief Counters returned when a worker finishes.
struct WorkerStats {
  std::uint64_t iterations = 0;
  std::uint64_t failures = 0;
  std::uint64_t parked = 0; ///< Times the worker paused on a zero rate.
};

/// @brief Pacing loop over a strand.
///
/// Each iteration reads the current rate from the active plan, runs one unit
/// of work, then waits until `previous fire time + delay`. The deadline is
/// only checked between iterations; an in-flight request runs to its own
/// timeout. The worker owns its SessionStore for its whole lifetime.
class Worker {
public:
  using Clock = std::chrono::steady_clock;
  using Executor = net::strand<net::io_context::executor_type>;

  Worker(WorkerConfig cfg, Executor strand,
         std::shared_ptr<EngineContext> engine,
         std::shared_ptr<ConfigChannel> channel,
         std::shared_ptr<HttpClient> client);

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  /// @brief Run until the deadline. Must be spawned on executor().
  [[nodiscard]] auto run() -> net::awaitable<WorkerStats>;

  /// @brief End a zero-rate park early so a new plan is read at once.
  ///        Pacing pauses are left alone. Safe from any thread.
  void wake();

  [[nodiscard]] auto executor() const -> const Executor & { return strand_; }
  [[nodiscard]] auto session() const noexcept -> const SessionStore & {
    return session_;
  }

  /// @brief Offset of this worker's first fire within the first cycle.
  [[nodiscard]] static auto stagger_offset(std::size_t id, std::size_t count,
                                           std::chrono::milliseconds cycle)
      -> std::chrono::milliseconds;

private:
  void refresh_plan();
  auto pause_until(Clock::time_point when) -> net::awaitable<void>;
  auto run_once() -> net::awaitable<bool>;
  auto run_request(const RequestConfig &request) -> net::awaitable<bool>;
  auto run_scenario(const Scenario &scenario) -> net::awaitable<bool>;
  void record_latency(MultiLabelLatencyTracker &tracker,
                      const std::string &label, double elapsed_ms);
  void log_transport_failure(const TransportError &error);

  WorkerConfig cfg_;
  Executor strand_;
  std::shared_ptr<EngineContext> engine_;
  std::shared_ptr<ConfigChannel> channel_;
  std::shared_ptr<HttpClient> client_;

  ConfigChannel::PlanPtr plan_;
  std::uint64_t plan_version_ = 0;
  std::optional<ScenarioEngine> scenarios_;

  SessionStore session_;
  net::steady_timer pacer_;
  bool parked_ = false; ///< Touched only on strand_.
  std::bitset<8> logged_kinds_;
  WorkerStats stats_;
};

} // namespace loadcurve
