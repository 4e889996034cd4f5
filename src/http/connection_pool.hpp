#pragma once
/// @file connection_pool.hpp
/// @brief Idle keep-alive connections for the Beast client.

#include "http/asio.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace loadcurve {

struct PoolOptions {
  std::size_t max_idle_per_host = 32;
  std::chrono::milliseconds idle_timeout{90'000};
};

/// @brief Idle streams keyed by `host:port` and the executor that opened
///        them.
///
/// A stream is only handed back to a coroutine running on the same executor,
/// so with one strand per worker a connection never crosses workers. Expired
/// entries are dropped on the next acquire() or release() for the same key.
class ConnectionPool {
public:
  using Clock = std::chrono::steady_clock;
  using StreamPtr = std::unique_ptr<beast::tcp_stream>;

  explicit ConnectionPool(PoolOptions options = {});

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool &operator=(const ConnectionPool &) = delete;

  /// @brief Most recently released idle stream for the key; nullptr if none.
  [[nodiscard]] auto acquire(const std::string &host_key,
                             const net::any_io_executor &executor)
      -> StreamPtr;

  /// @brief Park an open stream. The oldest entry for the key is closed when
  ///        the per-host cap is reached.
  void release(const std::string &host_key, net::any_io_executor executor,
               StreamPtr stream);

  /// @brief Close every idle stream. Call before the owning io_context is
  ///        destroyed.
  void clear();

  [[nodiscard]] auto idle_count() const -> std::size_t;
  [[nodiscard]] auto options() const noexcept -> const PoolOptions & {
    return options_;
  }

private:
  struct Idle {
    std::string host_key;
    net::any_io_executor executor;
    StreamPtr stream;
    Clock::time_point since;
  };

  /// Move expired entries for the key out of idle_. Caller holds mutex_.
  void take_expired(const std::string &host_key,
                    const net::any_io_executor &executor,
                    Clock::time_point now, std::vector<Idle> &out);

  PoolOptions options_;
  mutable std::mutex mutex_;
  std::vector<Idle> idle_;
};

} // namespace loadcurve
