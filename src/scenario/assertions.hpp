#pragma once
/// @file assertions.hpp
/// @brief Evaluation of step assertions against a received response.

#include "core/errors.hpp"
#include "http/http_client.hpp"
#include "scenario/scenario.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

namespace loadcurve {

/// @brief Measured response time, sub-millisecond precision kept.
using ElapsedMs = std::chrono::duration<double, std::milli>;

/// @brief Result of running a step's assertions. Every assertion is evaluated.
struct AssertionReport {
  std::size_t passed = 0;
  std::vector<AssertionFailure> failures;

  [[nodiscard]] auto all_passed() const noexcept -> bool {
    return failures.empty();
  }
};

/// @brief Check one assertion; nullopt when it holds.
[[nodiscard]] auto check_assertion(const Assertion &assertion,
                                   const HttpResponse &response,
                                   ElapsedMs elapsed)
    -> std::optional<AssertionFailure>;

[[nodiscard]] auto run_assertions(const std::vector<Assertion> &assertions,
                                  const HttpResponse &response,
                                  ElapsedMs elapsed)
    -> AssertionReport;

} // namespace loadcurve
