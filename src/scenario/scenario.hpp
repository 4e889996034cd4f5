#pragma once
/// @file scenario.hpp
/// @brief Immutable scenario definitions: ordered HTTP steps with
///        extractions, assertions and think time.
///
/// A Scenario is built once from configuration and shared read-only by every
/// worker through a shared_ptr<const Scenario>.

#include "data/data_source.hpp"
#include "scenario/pattern.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace loadcurve {

// ─── Request ────────────────────────────────────────────────────────────

/// @brief Templated request. `${name}` placeholders are resolved at send time.
struct RequestConfig {
  std::string method = "GET";
  std::string path;
  std::optional<std::string> body;
  std::map<std::string, std::string> headers;
};

// ─── Extraction ─────────────────────────────────────────────────────────

/// @brief `$.a.b[0].c` evaluated against the parsed JSON body.
struct JsonPathExtractor {
  std::string path;
};

/// @brief First match of @p pattern; @p group is a capture index ("1") or
///        empty for the whole match.
struct RegexExtractor {
  Pattern pattern;
  std::string group;
};

/// @brief Response header value (case-insensitive name).
struct HeaderExtractor {
  std::string name;
};

/// @brief Value of a cookie set by this response.
struct CookieExtractor {
  std::string name;
};

using Extractor = std::variant<JsonPathExtractor, RegexExtractor,
                               HeaderExtractor, CookieExtractor>;

struct VariableExtraction {
  std::string variable;
  Extractor extractor;
};

// ─── Assertions ─────────────────────────────────────────────────────────

namespace assertion {

struct StatusCode {
  std::uint16_t expected = 200;
};

struct BodyContains {
  std::string substring;
};

struct ResponseTime {
  std::chrono::milliseconds max{0};
};

/// @brief Path must resolve; if @p expected is set the rendered value must
///        equal it.
struct JsonPath {
  std::string path;
  std::optional<std::string> expected;
};

struct BodyMatches {
  Pattern pattern;
};

struct HeaderExists {
  std::string name;
};

} // namespace assertion

using Assertion =
    std::variant<assertion::StatusCode, assertion::BodyContains,
                 assertion::ResponseTime, assertion::JsonPath,
                 assertion::BodyMatches, assertion::HeaderExists>;

// ─── Think time ─────────────────────────────────────────────────────────

struct FixedThinkTime {
  std::chrono::milliseconds delay{0};
};

/// @brief Uniformly distributed pause in [min, max].
struct RandomThinkTime {
  std::chrono::milliseconds min{0};
  std::chrono::milliseconds max{0};
};

using ThinkTime = std::variant<FixedThinkTime, RandomThinkTime>;

/// @brief Concrete pause for one step execution.
[[nodiscard]] auto resolve_delay(const ThinkTime &t) -> std::chrono::milliseconds;

// ─── Step / Scenario ────────────────────────────────────────────────────

/// @brief Opaque per-step caching directive.
///
/// Parsed and carried so plans that declare it still load; the engine does
/// not act on it. Key, eviction and staleness semantics are not defined.
struct CacheDirective {
  std::string raw_json;
};

struct Step {
  std::string name;
  RequestConfig request;
  std::vector<VariableExtraction> extractions;
  std::vector<Assertion> assertions;
  std::optional<ThinkTime> think_time;
  std::optional<CacheDirective> cache;
};

struct Scenario {
  std::string name;
  double weight = 1.0; ///< Relative selection probability in a mix.
  std::vector<Step> steps;
  /// Rows bulk-loaded into the context before each execution, if set.
  std::shared_ptr<const DataSource> data;
};

} // namespace loadcurve
