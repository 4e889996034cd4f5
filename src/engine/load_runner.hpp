#pragma once
/// @file load_runner.hpp
/// @brief Owns the io_context, worker strands and the memory guard for one
///        run, and blocks until the deadline.

#include "engine/config_channel.hpp"
#include "engine/engine_context.hpp"
#include "engine/worker.hpp"
#include "guard/memory_guard.hpp"
#include "http/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace loadcurve {

struct RunSummary {
  std::chrono::duration<double> elapsed{0};
  std::size_t workers = 0;
  std::uint64_t iterations = 0;
  std::uint64_t failures = 0;
  GuardState guard;
  std::uint64_t plan_updates = 0;
};

/// @brief Runs every worker of the current plan to completion.
///
/// Worker count and duration are fixed from the plan at start(); later
/// publishes change the load model and scenarios only.
class LoadRunner {
public:
  using Clock = std::chrono::steady_clock;

  LoadRunner(std::shared_ptr<ConfigChannel> channel,
             std::shared_ptr<EngineContext> engine,
             std::shared_ptr<HttpClient> client,
             std::unique_ptr<MemoryLimitProvider> memory,
             std::size_t threads = 0);
  ~LoadRunner();

  LoadRunner(const LoadRunner &) = delete;
  LoadRunner &operator=(const LoadRunner &) = delete;

  /// @brief Block until every worker has passed the deadline.
  auto run() -> RunSummary;

  /// @brief Thread count actually used (0 at construction → hardware).
  [[nodiscard]] auto threads() const noexcept -> std::size_t {
    return threads_;
  }

private:
  std::shared_ptr<ConfigChannel> channel_;
  std::shared_ptr<EngineContext> engine_;
  std::shared_ptr<HttpClient> client_;
  std::unique_ptr<MemoryLimitProvider> memory_;
  std::size_t threads_;

  net::io_context ioc_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::unique_ptr<MemoryGuard> guard_;
  std::optional<ConfigChannel::SubscriptionId> subscription_;
  std::atomic<std::uint64_t> plan_updates_{0};
};

} // namespace loadcurve
