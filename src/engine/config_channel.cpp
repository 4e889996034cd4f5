/// @file config_channel.cpp
/// @brief ConfigChannel implementation.

#include "engine/config_channel.hpp"

#include <algorithm>
#include <utility>

namespace loadcurve {

ConfigChannel::ConfigChannel(PlanPtr initial) : plan_{std::move(initial)} {}

void ConfigChannel::publish(PlanPtr plan) {
  std::lock_guard dispatch(dispatch_mutex_);
  std::vector<Listener> to_notify;
  std::uint64_t version = 0;
  {
    std::lock_guard lock(mutex_);
    plan_ = plan;
    version = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
    to_notify.reserve(listeners_.size());
    for (const auto &[id, fn] : listeners_) {
      to_notify.push_back(fn);
    }
  }
  for (const auto &fn : to_notify) {
    fn(plan, version);
  }
}

auto ConfigChannel::current() const -> PlanPtr {
  std::lock_guard lock(mutex_);
  return plan_;
}

auto ConfigChannel::subscribe(Listener listener) -> SubscriptionId {
  std::lock_guard lock(mutex_);
  const auto id = next_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void ConfigChannel::unsubscribe(SubscriptionId id) {
  {
    std::lock_guard lock(mutex_);
    std::erase_if(listeners_, [id](const auto &p) { return p.first == id; });
  }
  // A publish may still hold a copy of the listener; wait for it to finish.
  std::lock_guard dispatch(dispatch_mutex_);
}

} // namespace loadcurve
