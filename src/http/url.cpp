/// @file url.cpp
/// @brief URL parsing and joining.

#include "http/url.hpp"
#include "core/strings.hpp"

#include <charconv>

namespace loadcurve {

namespace {

auto invalid(std::string_view text, std::string_view why) -> TransportError {
  return TransportError{
      .kind = TransportErrorKind::InvalidRequest,
      .message = std::string{why} + ": '" + std::string{text} + "'",
  };
}

auto starts_with_icase(std::string_view s, std::string_view prefix) -> bool {
  return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
}

} // namespace

auto Url::host_header() const -> std::string {
  const bool ipv6 = host.find(':') != std::string::npos;
  std::string out = ipv6 ? "[" + host + "]" : host;
  const bool default_port =
      (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
  if (!default_port) {
    out += ':';
    out += std::to_string(port);
  }
  return out;
}

auto parse_url(std::string_view text) -> std::expected<Url, TransportError> {
  Url url;

  const auto sep = text.find("://");
  if (sep == std::string_view::npos) {
    return std::unexpected(invalid(text, "missing scheme"));
  }
  url.scheme = to_lower(text.substr(0, sep));
  if (url.scheme == "http") {
    url.port = 80;
  } else if (url.scheme == "https") {
    url.port = 443;
  } else {
    return std::unexpected(invalid(text, "unsupported scheme"));
  }

  auto rest = text.substr(sep + 3);
  if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
    rest = rest.substr(0, hash);
  }

  const auto path_start = rest.find_first_of("/?");
  auto authority = rest.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    url.target = std::string{rest.substr(path_start)};
    if (url.target.front() == '?') {
      url.target.insert(url.target.begin(), '/');
    }
  }

  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority = authority.substr(at + 1); // Userinfo is not forwarded.
  }

  std::string_view port_text;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return std::unexpected(invalid(text, "unterminated IPv6 host"));
    }
    url.host = std::string{authority.substr(1, close - 1)};
    const auto after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        return std::unexpected(invalid(text, "malformed authority"));
      }
      port_text = after.substr(1);
    }
  } else {
    const auto colon = authority.rfind(':');
    url.host = std::string{authority.substr(0, colon)};
    if (colon != std::string_view::npos) {
      port_text = authority.substr(colon + 1);
    }
  }

  if (url.host.empty()) {
    return std::unexpected(invalid(text, "missing host"));
  }

  if (!port_text.empty()) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(),
                                     port_text.data() + port_text.size(), value);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
        value == 0 || value > 65535) {
      return std::unexpected(invalid(text, "invalid port"));
    }
    url.port = static_cast<std::uint16_t>(value);
  }

  return url;
}

auto is_absolute_url(std::string_view s) -> bool {
  return starts_with_icase(s, "http://") || starts_with_icase(s, "https://");
}

auto join_url(std::string_view base, std::string_view path) -> std::string {
  if (is_absolute_url(path)) {
    return std::string{path};
  }
  while (base.ends_with('/')) {
    base.remove_suffix(1);
  }
  std::string out{base};
  if (!path.starts_with('/')) {
    out += '/';
  }
  out += path;
  return out;
}

} // namespace loadcurve
