#pragma once
/// @file json_report.hpp
/// @brief nlohmann/json serialization for run statistics.

#include "engine/load_runner.hpp"
#include "metrics/latency_tracker.hpp"
#include "metrics/outcome.hpp"
#include "metrics/throughput_tracker.hpp"

#include <nlohmann/json.hpp>

namespace loadcurve {

inline void to_json(nlohmann::json &j, const LatencyStats &s) {
  j = nlohmann::json{
      {"count", s.count},   {"min_us", s.min_us}, {"max_us", s.max_us},
      {"mean_us", s.mean_us}, {"p50_us", s.p50_us}, {"p90_us", s.p90_us},
      {"p95_us", s.p95_us}, {"p99_us", s.p99_us}, {"p99_9_us", s.p99_9_us},
  };
}

inline void to_json(nlohmann::json &j, const ThroughputStats &s) {
  j = nlohmann::json{
      {"label", s.label},
      {"total_count", s.total_count},
      {"avg_time_ms", s.avg_time_ms},
      {"rps", s.rps},
      {"duration_s", s.duration.count()},
  };
}

inline void to_json(nlohmann::json &j, const OutcomeTotals &t) {
  nlohmann::json codes = nlohmann::json::object();
  for (const auto &[code, count] : t.status_codes) {
    codes[std::to_string(code)] = count;
  }
  nlohmann::json categories = nlohmann::json::object();
  for (std::size_t i = 0; i < kErrorCategoryCount; ++i) {
    categories[label(static_cast<ErrorCategory>(i))] = t.categories[i];
  }
  j = nlohmann::json{
      {"requests", t.requests},
      {"errors", t.errors()},
      {"transport_errors", t.transport_errors},
      {"status_codes", codes},
      {"error_categories", categories},
      {"scenarios",
       {{"total", t.scenarios},
        {"succeeded", t.scenario_successes},
        {"failed", t.scenario_failures},
        {"interrupted", t.scenario_interrupted}}},
  };
}

inline void to_json(nlohmann::json &j, const GuardState &g) {
  j = nlohmann::json{
      {"active", g.active},
      {"warning_triggered", g.warning_triggered},
      {"critical_triggered", g.critical_triggered},
      {"warnings", g.warnings},
      {"criticals", g.criticals},
      {"last_usage_percent", g.last_usage_percent},
      {"tracking_disabled", g.disabled_at.has_value()},
  };
}

/// @brief Latency stats of every label in @p tracker, keyed by label.
inline auto latency_to_json(const MultiLabelLatencyTracker &tracker)
    -> nlohmann::json {
  nlohmann::json out = nlohmann::json::object();
  for (const auto &[label, stats] : tracker.all_stats()) {
    out[label] = stats;
  }
  return out;
}

} // namespace loadcurve
