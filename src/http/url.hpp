#pragma once
/// @file url.hpp
/// @brief Minimal absolute-URL parsing for the HTTP client.

#include "core/errors.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace loadcurve {

struct Url {
  std::string scheme; ///< Lower-case, "http" or "https".
  std::string host;
  std::uint16_t port = 80;
  std::string target = "/"; ///< Path plus query, always starts with '/'.

  /// @brief Value for the Host header (port omitted when default).
  [[nodiscard]] auto host_header() const -> std::string;
};

/// @brief Parse `scheme://host[:port][/path][?query]`.
///
/// Fragments are dropped. Bracketed IPv6 hosts are accepted. Errors are
/// reported as TransportErrorKind::InvalidRequest.
[[nodiscard]] auto parse_url(std::string_view text)
    -> std::expected<Url, TransportError>;

/// @brief True for `http://` or `https://` prefixes (case-insensitive).
[[nodiscard]] auto is_absolute_url(std::string_view s) -> bool;

/// @brief Join a base URL and a step path. Absolute paths win.
[[nodiscard]] auto join_url(std::string_view base, std::string_view path)
    -> std::string;

} // namespace loadcurve
