#pragma once
/// @file errors.hpp
/// @brief Closed error types for every fallible component, plus the
///        request-outcome categorization used by reports.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace loadcurve {

// ─── Transport ──────────────────────────────────────────────────────────

/// @brief What went wrong below the HTTP layer.
enum class TransportErrorKind : std::uint8_t {
  Dns,            ///< Host name could not be resolved.
  Connect,        ///< TCP connect refused / unreachable.
  Tls,            ///< TLS requested or handshake failed.
  Timeout,        ///< Client-side deadline expired.
  Protocol,       ///< Malformed HTTP or connection dropped mid-message.
  InvalidRequest, ///< Request could not be built (bad URL, bad method).
};

/// @brief A request that never produced an HTTP response.
struct TransportError {
  TransportErrorKind kind;
  std::string message;
};

[[nodiscard]] auto to_string(TransportErrorKind k) -> const char *;

/// @brief "connect: Connection refused" style rendering.
[[nodiscard]] auto describe(const TransportError &e) -> std::string;

// ─── Assertions ─────────────────────────────────────────────────────────

enum class AssertionKind : std::uint8_t {
  StatusCode,
  BodyContains,
  ResponseTime,
  JsonPath,
  BodyMatches,
  HeaderExists,
};

/// @brief A logical check that did not hold against a received response.
struct AssertionFailure {
  AssertionKind kind;
  std::string expected;
  std::string actual;
};

[[nodiscard]] auto to_string(AssertionKind k) -> const char *;
[[nodiscard]] auto describe(const AssertionFailure &f) -> std::string;

// ─── Extraction ─────────────────────────────────────────────────────────

enum class ExtractionFailureKind : std::uint8_t {
  InvalidJson,
  PathNotFound,
  InvalidPath,
  InvalidRegex,
  NoMatch,
  MatchAborted, ///< Matcher gave up on the body (complexity or memory).
  HeaderNotFound,
  CookieNotFound,
};

/// @brief Why a variable could not be extracted. Never fatal.
struct ExtractionFailure {
  ExtractionFailureKind kind;
  std::string variable;
  std::string detail;
};

[[nodiscard]] auto to_string(ExtractionFailureKind k) -> const char *;
[[nodiscard]] auto describe(const ExtractionFailure &f) -> std::string;

// ─── Configuration ──────────────────────────────────────────────────────

/// @brief Invalid plan or model parameters. Fatal at startup only.
struct ConfigError {
  std::string field;
  std::string message;
};

[[nodiscard]] auto describe(const ConfigError &e) -> std::string;

// ─── Outcome categories ─────────────────────────────────────────────────

/// @brief Coarse classification of a failed request for reporting.
enum class ErrorCategory : std::uint8_t {
  ClientError,
  ServerError,
  NetworkError,
  TimeoutError,
  TlsError,
  OtherError,
};

inline constexpr std::size_t kErrorCategoryCount = 6;

/// @brief Category for an HTTP status, or nullopt for 1xx–3xx.
[[nodiscard]] auto categorize_status(std::uint16_t status)
    -> std::optional<ErrorCategory>;

/// @brief Category for a request that failed below HTTP.
[[nodiscard]] auto categorize(const TransportError &e) -> ErrorCategory;

/// @brief Stable label, e.g. "timeout_error".
[[nodiscard]] auto label(ErrorCategory c) -> const char *;

/// @brief Human-readable description, e.g. "HTTP 5xx Server Errors".
[[nodiscard]] auto description(ErrorCategory c) -> const char *;

} // namespace loadcurve
