#pragma once
/// @file plan_loader.hpp
/// @brief JSON plan files → RunPlan.

#include "core/errors.hpp"
#include "engine/run_plan.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace loadcurve {

/// @brief `30`, `1.5`, `"30s"`, `"500ms"`, `"10m"`, `"2h"`, `"1d"`.
[[nodiscard]] auto parse_duration(std::string_view text)
    -> std::expected<Seconds, ConfigError>;

/// @brief Number (seconds) or duration string.
[[nodiscard]] auto parse_duration(const nlohmann::json &value,
                                  const std::string &field)
    -> std::expected<Seconds, ConfigError>;

/// @brief Parsed plan plus non-fatal validation warnings.
struct LoadedPlan {
  RunPlan plan;
  std::vector<std::string> warnings;
};

/// @brief Build a plan from a parsed document.
/// @param base_dir Directory that relative `dataFile` paths resolve against.
[[nodiscard]] auto plan_from_json(const nlohmann::json &doc,
                                  const std::filesystem::path &base_dir)
    -> std::expected<LoadedPlan, ConfigError>;

[[nodiscard]] auto load_plan_string(std::string_view text,
                                    const std::filesystem::path &base_dir = ".")
    -> std::expected<LoadedPlan, ConfigError>;

[[nodiscard]] auto load_plan_file(const std::filesystem::path &path)
    -> std::expected<LoadedPlan, ConfigError>;

} // namespace loadcurve
