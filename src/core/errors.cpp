/// @file errors.cpp
/// @brief String rendering and categorization for the closed error types.

#include "core/errors.hpp"

namespace loadcurve {

auto to_string(TransportErrorKind k) -> const char * {
  switch (k) {
  case TransportErrorKind::Dns:
    return "dns";
  case TransportErrorKind::Connect:
    return "connect";
  case TransportErrorKind::Tls:
    return "tls";
  case TransportErrorKind::Timeout:
    return "timeout";
  case TransportErrorKind::Protocol:
    return "protocol";
  case TransportErrorKind::InvalidRequest:
    return "invalid_request";
  }
  return "unknown";
}

auto describe(const TransportError &e) -> std::string {
  return std::string{to_string(e.kind)} + ": " + e.message;
}

auto to_string(AssertionKind k) -> const char * {
  switch (k) {
  case AssertionKind::StatusCode:
    return "status_code";
  case AssertionKind::BodyContains:
    return "body_contains";
  case AssertionKind::ResponseTime:
    return "response_time";
  case AssertionKind::JsonPath:
    return "json_path";
  case AssertionKind::BodyMatches:
    return "body_matches";
  case AssertionKind::HeaderExists:
    return "header_exists";
  }
  return "unknown";
}

auto describe(const AssertionFailure &f) -> std::string {
  return std::string{to_string(f.kind)} + ": expected " + f.expected +
         ", got " + f.actual;
}

auto to_string(ExtractionFailureKind k) -> const char * {
  switch (k) {
  case ExtractionFailureKind::InvalidJson:
    return "invalid_json";
  case ExtractionFailureKind::PathNotFound:
    return "path_not_found";
  case ExtractionFailureKind::InvalidPath:
    return "invalid_path";
  case ExtractionFailureKind::InvalidRegex:
    return "invalid_regex";
  case ExtractionFailureKind::NoMatch:
    return "no_match";
  case ExtractionFailureKind::MatchAborted:
    return "match_aborted";
  case ExtractionFailureKind::HeaderNotFound:
    return "header_not_found";
  case ExtractionFailureKind::CookieNotFound:
    return "cookie_not_found";
  }
  return "unknown";
}

auto describe(const ExtractionFailure &f) -> std::string {
  auto out = f.variable + " <- " + to_string(f.kind);
  if (!f.detail.empty()) {
    out += " (" + f.detail + ")";
  }
  return out;
}

auto describe(const ConfigError &e) -> std::string {
  if (e.field.empty()) {
    return e.message;
  }
  return e.field + ": " + e.message;
}

auto categorize_status(std::uint16_t status) -> std::optional<ErrorCategory> {
  if (status >= 100 && status < 400) {
    return std::nullopt;
  }
  if (status >= 400 && status < 500) {
    return ErrorCategory::ClientError;
  }
  if (status >= 500 && status < 600) {
    return ErrorCategory::ServerError;
  }
  return ErrorCategory::OtherError;
}

auto categorize(const TransportError &e) -> ErrorCategory {
  switch (e.kind) {
  case TransportErrorKind::Dns:
  case TransportErrorKind::Connect:
  case TransportErrorKind::Protocol:
    return ErrorCategory::NetworkError;
  case TransportErrorKind::Timeout:
    return ErrorCategory::TimeoutError;
  case TransportErrorKind::Tls:
    return ErrorCategory::TlsError;
  case TransportErrorKind::InvalidRequest:
    return ErrorCategory::OtherError;
  }
  return ErrorCategory::OtherError;
}

auto label(ErrorCategory c) -> const char * {
  switch (c) {
  case ErrorCategory::ClientError:
    return "client_error";
  case ErrorCategory::ServerError:
    return "server_error";
  case ErrorCategory::NetworkError:
    return "network_error";
  case ErrorCategory::TimeoutError:
    return "timeout_error";
  case ErrorCategory::TlsError:
    return "tls_error";
  case ErrorCategory::OtherError:
    return "other_error";
  }
  return "other_error";
}

auto description(ErrorCategory c) -> const char * {
  switch (c) {
  case ErrorCategory::ClientError:
    return "HTTP 4xx Client Errors";
  case ErrorCategory::ServerError:
    return "HTTP 5xx Server Errors";
  case ErrorCategory::NetworkError:
    return "Network/Connection Errors";
  case ErrorCategory::TimeoutError:
    return "Request Timeout Errors";
  case ErrorCategory::TlsError:
    return "TLS/SSL Errors";
  case ErrorCategory::OtherError:
    return "Other/Unknown Errors";
  }
  return "Other/Unknown Errors";
}

} // namespace loadcurve
