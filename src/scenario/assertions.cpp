/// @file assertions.cpp
/// @brief Assertion checks.

#include "scenario/assertions.hpp"
#include "core/overloaded.hpp"
#include "scenario/extractor.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace loadcurve {

namespace {

auto fail(AssertionKind kind, std::string expected, std::string actual)
    -> std::optional<AssertionFailure> {
  return AssertionFailure{.kind = kind,
                          .expected = std::move(expected),
                          .actual = std::move(actual)};
}

auto check_json_path(const assertion::JsonPath &a,
                     const HttpResponse &response)
    -> std::optional<AssertionFailure> {
  const auto expected = a.expected.value_or("<present>");
  auto path = parse_json_path(a.path);
  if (!path.has_value()) {
    return fail(AssertionKind::JsonPath, expected,
                "invalid path: " + path.error());
  }
  const auto doc = nlohmann::json::parse(response.body, nullptr, false);
  if (doc.is_discarded()) {
    return fail(AssertionKind::JsonPath, expected, "body is not JSON");
  }
  const auto *node = resolve_json_path(doc, *path);
  if (node == nullptr) {
    return fail(AssertionKind::JsonPath, expected, a.path + " not found");
  }
  if (a.expected.has_value()) {
    auto actual = render_json_value(*node);
    if (actual != *a.expected) {
      return fail(AssertionKind::JsonPath, expected, std::move(actual));
    }
  }
  return std::nullopt;
}

auto check_body_matches(const assertion::BodyMatches &a,
                        const HttpResponse &response)
    -> std::optional<AssertionFailure> {
  const auto &source = a.pattern.source();
  auto groups = a.pattern.search(response.body);
  if (!groups.has_value()) {
    return fail(AssertionKind::BodyMatches, source, groups.error());
  }
  if (groups->empty()) {
    return fail(AssertionKind::BodyMatches, source, "no match");
  }
  return std::nullopt;
}

auto format_ms(ElapsedMs elapsed) -> std::string {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << elapsed.count();
  return out.str();
}

} // namespace

auto check_assertion(const Assertion &assertion, const HttpResponse &response,
                     ElapsedMs elapsed)
    -> std::optional<AssertionFailure> {
  return std::visit(
      overloaded{
          [&](const assertion::StatusCode &a)
              -> std::optional<AssertionFailure> {
            if (response.status == a.expected) {
              return std::nullopt;
            }
            return fail(AssertionKind::StatusCode, std::to_string(a.expected),
                        std::to_string(response.status));
          },
          [&](const assertion::BodyContains &a)
              -> std::optional<AssertionFailure> {
            if (response.body.find(a.substring) != std::string::npos) {
              return std::nullopt;
            }
            return fail(AssertionKind::BodyContains, a.substring,
                        "substring not found");
          },
          [&](const assertion::ResponseTime &a)
              -> std::optional<AssertionFailure> {
            if (elapsed <= a.max) {
              return std::nullopt;
            }
            return fail(AssertionKind::ResponseTime,
                        "<= " + std::to_string(a.max.count()) + "ms",
                        format_ms(elapsed) + "ms");
          },
          [&](const assertion::JsonPath &a) {
            return check_json_path(a, response);
          },
          [&](const assertion::BodyMatches &a) {
            return check_body_matches(a, response);
          },
          [&](const assertion::HeaderExists &a)
              -> std::optional<AssertionFailure> {
            if (response.header(a.name).has_value()) {
              return std::nullopt;
            }
            return fail(AssertionKind::HeaderExists, a.name, "missing");
          },
      },
      assertion);
}

auto run_assertions(const std::vector<Assertion> &assertions,
                    const HttpResponse &response,
                    ElapsedMs elapsed) -> AssertionReport {
  AssertionReport report;
  for (const auto &a : assertions) {
    if (auto failure = check_assertion(a, response, elapsed)) {
      report.failures.push_back(std::move(*failure));
    } else {
      ++report.passed;
    }
  }
  return report;
}

} // namespace loadcurve
