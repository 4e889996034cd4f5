#pragma once
/// @file session_store.hpp
/// @brief Per-worker cookie jar carried across steps and scenario iterations.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace loadcurve {

/// @brief Session artifacts owned by exactly one worker.
///
/// Move-only: a store cannot be duplicated, so two workers can never share
/// one by accident. Not thread-safe; only its owning worker touches it.
class SessionStore {
public:
  SessionStore() = default;
  ~SessionStore() = default;

  SessionStore(SessionStore &&) noexcept = default;
  SessionStore &operator=(SessionStore &&) noexcept = default;
  SessionStore(const SessionStore &) = delete;
  SessionStore &operator=(const SessionStore &) = delete;

  /// @brief Apply one `Set-Cookie` header value.
  ///
  /// Only the leading `name=value` pair is kept. `Max-Age=0` (or negative)
  /// and an empty value remove the cookie.
  void apply_set_cookie(std::string_view header_value);

  /// @brief Apply every `Set-Cookie` header in @p headers.
  void update_from_response(
      const std::vector<std::pair<std::string, std::string>> &headers);

  /// @brief `name1=v1; name2=v2`, or nullopt when the jar is empty.
  [[nodiscard]] auto cookie_header() const -> std::optional<std::string>;

  [[nodiscard]] auto cookie(std::string_view name) const
      -> std::optional<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t;

  void clear() noexcept;

private:
  std::map<std::string, std::string, std::less<>> cookies_;
};

/// @brief Parse the leading `name=value` of a `Set-Cookie` header.
[[nodiscard]] auto parse_set_cookie(std::string_view header_value)
    -> std::optional<std::pair<std::string, std::string>>;

} // namespace loadcurve
