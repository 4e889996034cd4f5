#pragma once
/// @file pattern.hpp
/// @brief Regular expressions compiled once at plan load and matched against
///        response bodies with Boost.Regex.

#include <boost/regex.hpp>

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace loadcurve {

/// @brief Immutable compiled Perl-syntax regex, shared by every worker.
///
/// Matching is non-recursive, so body size does not bound stack depth. A
/// match that exceeds the matcher's complexity or memory limits is reported
/// as an error instead of throwing.
class Pattern {
public:
  /// @brief Empty pattern; search() reports it as not compiled.
  Pattern() = default;

  [[nodiscard]] static auto compile(std::string source)
      -> std::expected<Pattern, std::string>;

  [[nodiscard]] auto source() const noexcept -> const std::string & {
    return source_;
  }
  [[nodiscard]] auto compiled() const noexcept -> bool {
    return re_ != nullptr;
  }

  /// @brief First match in @p text: group 0 then each capture group.
  ///        Empty when nothing matches.
  [[nodiscard]] auto search(std::string_view text) const
      -> std::expected<std::vector<std::string>, std::string>;

private:
  Pattern(std::string source, std::shared_ptr<const boost::regex> re)
      : source_{std::move(source)}, re_{std::move(re)} {}

  std::string source_;
  std::shared_ptr<const boost::regex> re_;
};

} // namespace loadcurve
