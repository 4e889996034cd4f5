#pragma once
/// @file memory_guard.hpp
/// @brief Background memory-pressure monitor that sheds latency tracking
///        before the process approaches its memory limit.

#include "engine/engine_context.hpp"
#include "http/asio.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace loadcurve {

struct MemoryGuardConfig {
  double warning_percent = 80.0;
  double critical_percent = 90.0;
  std::chrono::milliseconds interval{5000};
  bool auto_disable = true; ///< Disable tracking and rotate on warning.
};

/// @brief Source of the memory limit and current resident usage.
class MemoryLimitProvider {
public:
  virtual ~MemoryLimitProvider() = default;

  /// @brief Limit in bytes, or nullopt if it cannot be determined.
  [[nodiscard]] virtual auto detect_limit() -> std::optional<std::uint64_t> = 0;

  /// @brief Resident set size in bytes, or nullopt if unavailable.
  [[nodiscard]] virtual auto current_usage()
      -> std::optional<std::uint64_t> = 0;
};

/// @brief Linux provider reading cgroup files and /proc.
///
/// Limit: cgroup v2 `memory.max`, then cgroup v1 `memory.limit_in_bytes`
/// (values ≥ 2^60 mean unlimited), then `/proc/meminfo` MemTotal. Usage:
/// resident pages from `/proc/self/statm`. On other platforms both queries
/// return nullopt.
class ProcMemoryProvider final : public MemoryLimitProvider {
public:
  /// @param root Filesystem root; tests point this at a fixture tree.
  explicit ProcMemoryProvider(std::filesystem::path root = "/");

  [[nodiscard]] auto detect_limit() -> std::optional<std::uint64_t> override;
  [[nodiscard]] auto current_usage() -> std::optional<std::uint64_t> override;

  /// @brief Which file produced the last detected limit.
  [[nodiscard]] auto limit_source() const -> const std::string & {
    return limit_source_;
  }

private:
  std::filesystem::path root_;
  std::string limit_source_;
};

/// @brief What a single evaluation did.
enum class GuardAction : std::uint8_t {
  None,
  Warning,            ///< First crossing of the warning threshold.
  Critical,           ///< First crossing of the critical threshold.
  WarningAndCritical, ///< Both crossed in the same tick.
  Reset,              ///< Dropped 10 points below warning; latches cleared.
};

[[nodiscard]] auto to_string(GuardAction a) -> const char *;

struct GuardState {
  bool warning_triggered = false;
  bool critical_triggered = false;
  std::optional<std::chrono::steady_clock::time_point> disabled_at;
  double last_usage_percent = 0.0;
  std::uint64_t warnings = 0;  ///< Warning excursions seen.
  std::uint64_t criticals = 0; ///< Critical excursions seen.
  bool active = false;         ///< False when no limit could be detected.
};

/// @brief Latching threshold monitor over an EngineContext.
///
/// evaluate() is the pure per-tick state machine; run() drives it from an
/// Asio timer. Disabling tracking is one-way for the process lifetime.
class MemoryGuard {
public:
  using Clock = std::chrono::steady_clock;

  /// @brief Points below warning_percent at which the latches reset.
  static constexpr double kHysteresisPercent = 10.0;

  MemoryGuard(MemoryGuardConfig cfg, std::shared_ptr<EngineContext> engine,
              std::unique_ptr<MemoryLimitProvider> provider);

  /// @brief Detect the limit once. Logs and returns false if unavailable.
  auto initialize() -> bool;

  /// @brief Apply one usage sample to the state machine.
  auto evaluate(double usage_percent) -> GuardAction;

  /// @brief Read usage from the provider and evaluate it.
  /// @return nullopt when the guard is inactive or usage is unreadable.
  auto tick() -> std::optional<GuardAction>;

  /// @brief Poll every interval until @p deadline or stop().
  [[nodiscard]] auto run(Clock::time_point deadline) -> net::awaitable<void>;

  void stop() noexcept { stopped_.store(true, std::memory_order_relaxed); }

  [[nodiscard]] auto state() const noexcept -> const GuardState & {
    return state_;
  }
  [[nodiscard]] auto limit_bytes() const noexcept
      -> std::optional<std::uint64_t> {
    return limit_;
  }
  [[nodiscard]] auto config() const noexcept -> const MemoryGuardConfig & {
    return cfg_;
  }

private:
  MemoryGuardConfig cfg_;
  std::shared_ptr<EngineContext> engine_;
  std::unique_ptr<MemoryLimitProvider> provider_;
  std::optional<std::uint64_t> limit_;
  GuardState state_;
  std::atomic<bool> stopped_{false};
};

} // namespace loadcurve
