/// @file session_store.cpp
/// @brief Cookie jar implementation.

#include "scenario/session_store.hpp"
#include "core/strings.hpp"

#include <charconv>

namespace loadcurve {

namespace {

/// True when an attribute list contains Max-Age <= 0.
auto expires_now(std::string_view attrs) -> bool {
  while (!attrs.empty()) {
    const auto semi = attrs.find(';');
    auto attr = trim(attrs.substr(0, semi));
    attrs = semi == std::string_view::npos ? std::string_view{}
                                           : attrs.substr(semi + 1);

    const auto eq = attr.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    if (!iequals(trim(attr.substr(0, eq)), "max-age")) {
      continue;
    }
    const auto value = trim(attr.substr(eq + 1));
    long long age = 0;
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), age);
    if (ec == std::errc{} && age <= 0) {
      return true;
    }
  }
  return false;
}

} // namespace

auto parse_set_cookie(std::string_view header_value)
    -> std::optional<std::pair<std::string, std::string>> {
  const auto semi = header_value.find(';');
  const auto pair = header_value.substr(0, semi);
  const auto eq = pair.find('=');
  if (eq == std::string_view::npos) {
    return std::nullopt;
  }
  const auto name = trim(pair.substr(0, eq));
  if (name.empty()) {
    return std::nullopt;
  }
  auto value = trim(pair.substr(eq + 1));
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return std::pair{std::string{name}, std::string{value}};
}

void SessionStore::apply_set_cookie(std::string_view header_value) {
  auto parsed = parse_set_cookie(header_value);
  if (!parsed) {
    return;
  }
  auto &[name, value] = *parsed;

  const auto semi = header_value.find(';');
  const auto attrs = semi == std::string_view::npos
                         ? std::string_view{}
                         : header_value.substr(semi + 1);

  if (value.empty() || expires_now(attrs)) {
    if (auto it = cookies_.find(name); it != cookies_.end()) {
      cookies_.erase(it);
    }
    return;
  }
  cookies_.insert_or_assign(std::move(name), std::move(value));
}

void SessionStore::update_from_response(
    const std::vector<std::pair<std::string, std::string>> &headers) {
  for (const auto &[name, value] : headers) {
    if (iequals(name, "set-cookie")) {
      apply_set_cookie(value);
    }
  }
}

auto SessionStore::cookie_header() const -> std::optional<std::string> {
  if (cookies_.empty()) {
    return std::nullopt;
  }
  std::string out;
  for (const auto &[name, value] : cookies_) {
    if (!out.empty()) {
      out += "; ";
    }
    out += name;
    out += '=';
    out += value;
  }
  return out;
}

auto SessionStore::cookie(std::string_view name) const
    -> std::optional<std::string> {
  auto it = cookies_.find(name);
  if (it == cookies_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto SessionStore::size() const noexcept -> std::size_t {
  return cookies_.size();
}

void SessionStore::clear() noexcept { cookies_.clear(); }

} // namespace loadcurve
