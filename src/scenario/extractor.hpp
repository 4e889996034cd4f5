#pragma once
/// @file extractor.hpp
/// @brief Pull variable values out of a response: JSON path, regex, header
///        or cookie.

#include "core/errors.hpp"
#include "http/http_client.hpp"
#include "scenario/scenario.hpp"
#include "scenario/variable_context.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace loadcurve {

/// @brief One parsed JSON path segment: object key or array index.
using PathSegment = std::variant<std::string, std::size_t>;

/// @brief Parse `$.a.b[0].c` (leading `$` and `.` optional).
[[nodiscard]] auto parse_json_path(std::string_view path)
    -> std::expected<std::vector<PathSegment>, std::string>;

/// @brief Walk @p doc along @p path; nullptr if any segment is missing.
[[nodiscard]] auto resolve_json_path(const nlohmann::json &doc,
                                     const std::vector<PathSegment> &path)
    -> const nlohmann::json *;

/// @brief Strings render raw (no quotes); everything else as compact JSON.
[[nodiscard]] auto render_json_value(const nlohmann::json &value)
    -> std::string;

/// @brief Evaluate one extractor against @p response.
[[nodiscard]] auto extract(const Extractor &extractor,
                           const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure>;

/// @brief Outcome of running a step's extractions.
struct ExtractionReport {
  std::size_t extracted = 0;
  std::vector<ExtractionFailure> failures;
};

/// @brief Run every extraction in order, inserting successes into @p ctx.
///
/// Failures leave the variable untouched and are returned for logging.
auto extract_variables(const std::vector<VariableExtraction> &extractions,
                       const HttpResponse &response, VariableContext &ctx)
    -> ExtractionReport;

} // namespace loadcurve
