#pragma once
/// @file http_client.hpp
/// @brief Transport-neutral request/response values and the client seam the
///        scenario engine and workers send through.

#include "core/errors.hpp"
#include "http/asio.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loadcurve {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// @brief Client-side deadline applied when a request does not set one.
inline constexpr std::chrono::milliseconds kDefaultRequestTimeout{30'000};

struct HttpRequest {
  std::string method = "GET";
  std::string url; ///< Absolute `http://host[:port]/target`.
  HeaderList headers;
  std::optional<std::string> body;
  std::chrono::milliseconds timeout{0}; ///< 0 → client default.
  /// Read the body in fixed chunks and drop it; only status, headers and
  /// body_bytes are returned.
  bool discard_body = false;
};

struct HttpResponse {
  std::uint16_t status = 0;
  HeaderList headers; ///< In wire order; repeated names (Set-Cookie) kept.
  std::string body;
  std::uint64_t body_bytes = 0; ///< Bytes received, kept or discarded.

  /// @brief First header named @p name (case-insensitive).
  [[nodiscard]] auto header(std::string_view name) const
      -> std::optional<std::string_view>;
};

using HttpResult = std::expected<HttpResponse, TransportError>;

/// @brief Sends one request and yields the full response or a TransportError.
///
/// Implementations must be safe to call from many coroutines at once. A
/// non-2xx status is a successful send.
class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual auto send(HttpRequest request)
      -> net::awaitable<HttpResult> = 0;

  /// @brief Drop any connections kept for reuse. Called once the io_context
  ///        that owns them has stopped.
  virtual void close_idle() {}
};

} // namespace loadcurve
