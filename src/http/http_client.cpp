/// @file http_client.cpp
/// @brief HttpResponse helpers.

#include "http/http_client.hpp"
#include "core/strings.hpp"

namespace loadcurve {

auto HttpResponse::header(std::string_view name) const
    -> std::optional<std::string_view> {
  for (const auto &[k, v] : headers) {
    if (iequals(k, name)) {
      return std::string_view{v};
    }
  }
  return std::nullopt;
}

} // namespace loadcurve
