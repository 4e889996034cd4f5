#pragma once
/// @file config_channel.hpp
/// @brief Push-based distribution of the active RunPlan.

#include "engine/run_plan.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace loadcurve {

/// @brief Holds the current plan and notifies subscribers on every publish.
///
/// Readers compare version() against the last version they saw and only take
/// the lock to fetch the plan when it changed.
class ConfigChannel {
public:
  using PlanPtr = std::shared_ptr<const RunPlan>;
  using Listener = std::function<void(const PlanPtr &, std::uint64_t)>;
  using SubscriptionId = std::size_t;

  explicit ConfigChannel(PlanPtr initial);

  ConfigChannel(const ConfigChannel &) = delete;
  ConfigChannel &operator=(const ConfigChannel &) = delete;

  /// @brief Replace the plan and call every listener with it.
  ///
  /// Listeners run on the publishing thread, outside the plan lock, and may
  /// read current() and version(). They must not publish or unsubscribe.
  /// Publishes are serialized.
  void publish(PlanPtr plan);

  [[nodiscard]] auto current() const -> PlanPtr;
  [[nodiscard]] auto version() const noexcept -> std::uint64_t {
    return version_.load(std::memory_order_acquire);
  }

  auto subscribe(Listener listener) -> SubscriptionId;

  /// @brief Remove a listener. Returns only once no publish is still
  ///        running it, so state it captured may be destroyed afterwards.
  void unsubscribe(SubscriptionId id);

private:
  mutable std::mutex mutex_;
  std::mutex dispatch_mutex_; ///< Held for the whole of publish().
  PlanPtr plan_;
  std::atomic<std::uint64_t> version_{1};
  std::vector<std::pair<SubscriptionId, Listener>> listeners_;
  SubscriptionId next_id_ = 1;
};

} // namespace loadcurve
