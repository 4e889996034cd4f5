/// @file pattern.cpp
/// @brief Pattern compilation and matching.

#include "scenario/pattern.hpp"

#include <stdexcept>

namespace loadcurve {

auto Pattern::compile(std::string source)
    -> std::expected<Pattern, std::string> {
  try {
    auto re = std::make_shared<const boost::regex>(source, boost::regex::perl);
    return Pattern{std::move(source), std::move(re)};
  } catch (const boost::regex_error &e) {
    return std::unexpected(source + ": " + e.what());
  }
}

auto Pattern::search(std::string_view text) const
    -> std::expected<std::vector<std::string>, std::string> {
  if (!re_) {
    return std::unexpected(std::string{"pattern not compiled"});
  }

  std::vector<std::string> groups;
  try {
    boost::match_results<std::string_view::const_iterator> m;
    if (!boost::regex_search(text.begin(), text.end(), m, *re_)) {
      return groups;
    }
    groups.reserve(m.size());
    for (std::size_t i = 0; i < m.size(); ++i) {
      groups.emplace_back(m[i].matched ? m[i].str() : std::string{});
    }
  } catch (const std::runtime_error &e) {
    return std::unexpected(std::string{"match aborted: "} + e.what());
  }
  return groups;
}

} // namespace loadcurve
