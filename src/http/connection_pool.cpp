/// @file connection_pool.cpp
/// @brief ConnectionPool implementation.

#include "http/connection_pool.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace loadcurve {

ConnectionPool::ConnectionPool(PoolOptions options) : options_{options} {}

void ConnectionPool::take_expired(const std::string &host_key,
                                  const net::any_io_executor &executor,
                                  Clock::time_point now,
                                  std::vector<Idle> &out) {
  auto stale = std::stable_partition(
      idle_.begin(), idle_.end(), [&](const Idle &e) {
        return e.host_key != host_key || e.executor != executor ||
               now - e.since < options_.idle_timeout;
      });
  out.insert(out.end(), std::make_move_iterator(stale),
             std::make_move_iterator(idle_.end()));
  idle_.erase(stale, idle_.end());
}

auto ConnectionPool::acquire(const std::string &host_key,
                             const net::any_io_executor &executor)
    -> StreamPtr {
  std::vector<Idle> closing; // Destroyed after the lock is released.
  std::lock_guard lock(mutex_);
  take_expired(host_key, executor, Clock::now(), closing);

  for (auto it = idle_.rbegin(); it != idle_.rend(); ++it) {
    if (it->host_key == host_key && it->executor == executor) {
      auto stream = std::move(it->stream);
      idle_.erase(std::next(it).base());
      return stream;
    }
  }
  return nullptr;
}

void ConnectionPool::release(const std::string &host_key,
                             net::any_io_executor executor,
                             StreamPtr stream) {
  if (!stream || options_.max_idle_per_host == 0) {
    return;
  }
  std::vector<Idle> closing;
  std::lock_guard lock(mutex_);
  const auto now = Clock::now();
  take_expired(host_key, executor, now, closing);

  const auto same = [&](const Idle &e) {
    return e.host_key == host_key && e.executor == executor;
  };
  if (static_cast<std::size_t>(std::count_if(idle_.begin(), idle_.end(),
                                             same)) >=
      options_.max_idle_per_host) {
    // Entries are appended in release order, so the first match is oldest.
    auto oldest = std::find_if(idle_.begin(), idle_.end(), same);
    closing.push_back(std::move(*oldest));
    idle_.erase(oldest);
  }
  idle_.push_back(Idle{.host_key = host_key,
                       .executor = std::move(executor),
                       .stream = std::move(stream),
                       .since = now});
}

void ConnectionPool::clear() {
  std::vector<Idle> closing;
  std::lock_guard lock(mutex_);
  closing.swap(idle_);
}

auto ConnectionPool::idle_count() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return idle_.size();
}

} // namespace loadcurve
