/// @file variable_context.cpp
/// @brief Variable bindings and placeholder substitution.

#include "scenario/variable_context.hpp"

#include <chrono>

namespace loadcurve {

namespace {

auto is_word_char(char c) noexcept -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

auto now_epoch_ms() -> std::string {
  using namespace std::chrono;
  const auto ms =
      duration_cast<milliseconds>(system_clock::now().time_since_epoch());
  return std::to_string(ms.count());
}

} // namespace

void VariableContext::set(std::string name, std::string value) {
  vars_.insert_or_assign(std::move(name), std::move(value));
}

void VariableContext::load_row(const DataRow &row) {
  for (const auto &[k, v] : row) {
    vars_.insert_or_assign(k, v);
  }
}

auto VariableContext::get(std::string_view name) const
    -> std::optional<std::string> {
  auto it = vars_.find(std::string{name});
  if (it == vars_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto VariableContext::contains(std::string_view name) const -> bool {
  return vars_.contains(std::string{name});
}

auto VariableContext::size() const noexcept -> std::size_t {
  return vars_.size();
}

void VariableContext::clear() noexcept { vars_.clear(); }

auto VariableContext::substitute(std::string_view input) const
    -> std::string {
  std::string out;
  out.reserve(input.size());

  std::size_t pos = 0;
  while (pos < input.size()) {
    const auto open = input.find("${", pos);
    if (open == std::string_view::npos) {
      out.append(input.substr(pos));
      break;
    }
    out.append(input.substr(pos, open - pos));

    const auto close = input.find('}', open + 2);
    if (close == std::string_view::npos) {
      out.append(input.substr(open));
      break;
    }

    const auto name = input.substr(open + 2, close - open - 2);
    bool valid = !name.empty();
    for (char c : name) {
      valid = valid && is_word_char(c);
    }

    if (!valid) {
      // Emit "${" and rescan from the character after it.
      out.append("${");
      pos = open + 2;
      continue;
    }

    if (auto it = vars_.find(std::string{name}); it != vars_.end()) {
      out.append(it->second);
    } else if (name == kTimestamp) {
      out.append(now_epoch_ms());
    } else {
      out.append(input.substr(open, close - open + 1));
    }
    pos = close + 1;
  }

  return out;
}

auto substitute_variables(std::string_view input, const VariableContext &ctx)
    -> std::string {
  return ctx.substitute(input);
}

} // namespace loadcurve
