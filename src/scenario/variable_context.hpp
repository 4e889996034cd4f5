#pragma once
/// @file variable_context.hpp
/// @brief Per-execution variable bindings and `${name}` substitution.

#include "data/data_source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace loadcurve {

/// @brief Name → value bindings for one scenario execution.
///
/// Written by CSV row loading (bulk, overwriting), step extractions and the
/// engine's built-ins; read by substitution, which never mutates.
class VariableContext {
public:
  /// @brief Name of the per-execution millisecond timestamp built-in.
  static constexpr std::string_view kTimestamp = "timestamp";

  void set(std::string name, std::string value);

  /// @brief Insert every column of @p row, overwriting existing keys.
  void load_row(const DataRow &row);

  [[nodiscard]] auto get(std::string_view name) const
      -> std::optional<std::string>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  void clear() noexcept;

  /// @brief Replace every `${ident}` whose ident is bound.
  ///
  /// Identifiers are ASCII word characters. Unbound placeholders and
  /// malformed ones (no closing brace, empty or non-word name) are copied
  /// through unchanged. Substituted values are not rescanned.
  [[nodiscard]] auto substitute(std::string_view input) const -> std::string;

private:
  std::unordered_map<std::string, std::string> vars_;
};

/// @brief Free-function form of VariableContext::substitute.
[[nodiscard]] auto substitute_variables(std::string_view input,
                                        const VariableContext &ctx)
    -> std::string;

} // namespace loadcurve
