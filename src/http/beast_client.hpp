#pragma once
/// @file beast_client.hpp
/// @brief Plain-TCP HTTP/1.1 client on Boost.Beast with keep-alive reuse.

#include "http/connection_pool.hpp"
#include "http/http_client.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace loadcurve {

using ResolveResults = tcp::resolver::results_type;
using ResolveHandler = std::function<void(beast::error_code, ResolveResults)>;

/// @brief Starts name resolution for host/service and calls the handler at
///        most once, from any thread.
using Resolver =
    std::function<void(const net::any_io_executor &, const std::string &,
                       const std::string &, ResolveHandler)>;

/// @brief Resolver backed by tcp::resolver.
void system_resolve(const net::any_io_executor &executor,
                    const std::string &host, const std::string &service,
                    ResolveHandler done);

struct BeastClientOptions {
  std::chrono::milliseconds default_timeout = kDefaultRequestTimeout;
  PoolOptions pool{};
  Resolver resolver = system_resolve;
};

/// @brief HTTP/1.1 over keep-alive TCP connections.
///
/// One deadline covers resolve, connect, write and read. Connections the
/// server keeps open go back to a per-host idle pool; a pooled connection
/// found closed by the peer is retried once on a fresh one. `https` targets
/// are rejected with TransportErrorKind::Tls; TLS stream setup is not built
/// here.
class BeastHttpClient final : public HttpClient {
public:
  explicit BeastHttpClient(
      std::chrono::milliseconds default_timeout = kDefaultRequestTimeout);
  explicit BeastHttpClient(BeastClientOptions options);
  ~BeastHttpClient() override;

  [[nodiscard]] auto send(HttpRequest request)
      -> net::awaitable<HttpResult> override;

  void close_idle() override { pool_.clear(); }

  [[nodiscard]] auto default_timeout() const noexcept
      -> std::chrono::milliseconds {
    return default_timeout_;
  }

  [[nodiscard]] auto idle_connections() const -> std::size_t {
    return pool_.idle_count();
  }

  /// @brief Largest response body kept in memory before the read fails.
  static constexpr std::size_t kMaxBodyBytes = 64 * 1024 * 1024;

  /// @brief Chunk size used when a body is discarded.
  static constexpr std::size_t kDiscardChunkBytes = 16 * 1024;

private:
  std::chrono::milliseconds default_timeout_;
  Resolver resolver_;
  ConnectionPool pool_;
};

} // namespace loadcurve
