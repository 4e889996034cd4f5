#pragma once
/// @file report.hpp
/// @brief End-of-run report: console summary and JSON export.

#include "engine/engine_context.hpp"
#include "engine/load_runner.hpp"
#include "engine/run_plan.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <ostream>
#include <system_error>

namespace loadcurve {

/// @brief Human-readable summary.
void print_report(std::ostream &os, const RunPlan &plan,
                  const RunSummary &summary, EngineContext &engine);

/// @brief Whole-run document for --json-report.
[[nodiscard]] auto build_json_report(const RunPlan &plan,
                                     const RunSummary &summary,
                                     EngineContext &engine) -> nlohmann::json;

/// @brief Write @p report pretty-printed to @p path.
[[nodiscard]] auto write_json_report(const std::filesystem::path &path,
                                     const nlohmann::json &report)
    -> std::expected<void, std::error_code>;

} // namespace loadcurve
