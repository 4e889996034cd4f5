#pragma once
/// @file strings.hpp
/// @brief Small ASCII string helpers shared by the HTTP and scenario code.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace loadcurve {

[[nodiscard]] inline auto trim(std::string_view s) noexcept
    -> std::string_view {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

/// @brief ASCII case-insensitive comparison (header and cookie names).
[[nodiscard]] inline auto iequals(std::string_view a,
                                  std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

[[nodiscard]] inline auto to_upper(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

} // namespace loadcurve
