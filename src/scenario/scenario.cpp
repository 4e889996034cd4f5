/// @file scenario.cpp
/// @brief Think-time resolution.

#include "scenario/scenario.hpp"
#include "core/overloaded.hpp"

#include <algorithm>
#include <random>

namespace loadcurve {

namespace {

auto &rng() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  return gen;
}

} // namespace

auto resolve_delay(const ThinkTime &t) -> std::chrono::milliseconds {
  return std::visit(
      overloaded{
          [](const FixedThinkTime &f) { return f.delay; },
          [](const RandomThinkTime &r) {
            const auto lo = std::min(r.min, r.max).count();
            const auto hi = std::max(r.min, r.max).count();
            std::uniform_int_distribution<std::int64_t> dist(lo, hi);
            return std::chrono::milliseconds{dist(rng())};
          },
      },
      t);
}

} // namespace loadcurve
