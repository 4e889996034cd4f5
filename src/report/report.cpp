/// @file report.cpp
/// @brief Report rendering.

#include "report/report.hpp"
#include "metrics/format.hpp"
#include "report/json_report.hpp"

#include <fstream>
#include <iomanip>
#include <string>

namespace loadcurve {

namespace {

void print_separator(std::ostream &os) { os << std::string(60, '=') << '\n'; }

void print_latency_section(std::ostream &os, const char *title,
                           const MultiLabelLatencyTracker &tracker) {
  auto all = tracker.all_stats();
  if (all.empty()) {
    return;
  }
  os << "\n  " << title << " latency\n";
  for (const auto &[label, stats] : all) {
    os << "    " << std::left << std::setw(28) << label << std::right << ' '
       << format_latency_line(stats) << '\n';
  }
  if (tracker.evictions() > 0) {
    os << "    (" << tracker.evictions()
       << " least recently used labels evicted)\n";
  }
}

} // namespace

void print_report(std::ostream &os, const RunPlan &plan,
                  const RunSummary &summary, EngineContext &engine) {
  const auto totals = engine.counters().totals();
  const double secs = summary.elapsed.count();

  os << '\n';
  print_separator(os);
  os << "  LOAD TEST RESULTS\n";
  print_separator(os);

  os << std::fixed << std::setprecision(1);
  os << "\n  Run\n"
     << "    Target:      " << plan.base_url << '\n'
     << "    Load model:  " << describe(plan.load) << '\n'
     << "    Workers:     " << summary.workers << '\n'
     << "    Duration:    " << secs << " s\n";
  if (summary.plan_updates > 0) {
    os << "    Reloads:     " << summary.plan_updates << '\n';
  }

  os << "\n  Requests\n"
     << "    Total:       " << totals.requests << '\n'
     << "    Errors:      " << totals.errors() << '\n'
     << "    Transport:   " << totals.transport_errors << '\n'
     << "    Rate:        "
     << format_rate(secs > 0 ? static_cast<double>(totals.requests) / secs
                             : 0.0)
     << '\n';

  if (!totals.status_codes.empty()) {
    os << "\n  Status codes\n";
    for (const auto &[code, count] : totals.status_codes) {
      os << "    " << code << ":         " << count << '\n';
    }
  }

  if (totals.errors() > 0) {
    os << "\n  Errors by category\n";
    for (std::size_t i = 0; i < kErrorCategoryCount; ++i) {
      if (totals.categories[i] == 0) {
        continue;
      }
      const auto c = static_cast<ErrorCategory>(i);
      os << "    " << std::left << std::setw(16) << label(c) << std::right
         << totals.categories[i] << "  (" << description(c) << ")\n";
    }
  }

  if (totals.scenarios > 0) {
    os << "\n  Scenarios\n"
       << "    Executed:    " << totals.scenarios << '\n'
       << "    Succeeded:   " << totals.scenario_successes << '\n'
       << "    Failed:      " << totals.scenario_failures << '\n';
    if (totals.scenario_interrupted > 0) {
      os << "    Cut short:   " << totals.scenario_interrupted << '\n';
    }
  }

  const auto throughput = engine.throughput().all_stats();
  if (!throughput.empty()) {
    os << "\n  Throughput\n";
    for (const auto &t : throughput) {
      os << "    " << std::left << std::setw(28) << t.label << std::right
         << ' ' << format_throughput_line(t) << '\n';
    }
    os << "    Total:       " << format_rate(engine.throughput().total_throughput())
       << '\n';
  }

  print_latency_section(os, "Request", engine.request_latency());
  print_latency_section(os, "Scenario", engine.scenario_latency());
  print_latency_section(os, "Step", engine.step_latency());

  os << "\n  Memory guard\n";
  if (!summary.guard.active) {
    os << "    Inactive (no memory limit detected)\n";
  } else {
    os << "    Last usage:  " << summary.guard.last_usage_percent << " %\n"
       << "    Warnings:    " << summary.guard.warnings << '\n'
       << "    Criticals:   " << summary.guard.criticals << '\n';
  }
  os << "    Tracking:    " << (engine.tracking_active() ? "on" : "off");
  if (engine.skipped_samples() > 0) {
    os << " (" << engine.skipped_samples() << " samples skipped)";
  }
  os << '\n';

  print_separator(os);
  os << std::endl;
}

auto build_json_report(const RunPlan &plan, const RunSummary &summary,
                       EngineContext &engine) -> nlohmann::json {
  nlohmann::json j;
  j["target"] = plan.base_url;
  j["load_model"] = describe(plan.load);
  j["workers"] = summary.workers;
  j["duration_s"] = summary.elapsed.count();
  j["iterations"] = summary.iterations;
  j["plan_updates"] = summary.plan_updates;
  j["outcomes"] = engine.counters().totals();
  j["throughput"] = engine.throughput().all_stats();
  j["total_rps"] = engine.throughput().total_throughput();
  j["latency"] = {
      {"request", latency_to_json(engine.request_latency())},
      {"scenario", latency_to_json(engine.scenario_latency())},
      {"step", latency_to_json(engine.step_latency())},
  };
  j["tracking_active"] = engine.tracking_active();
  j["skipped_samples"] = engine.skipped_samples();
  j["memory_guard"] = summary.guard;
  return j;
}

auto write_json_report(const std::filesystem::path &path,
                       const nlohmann::json &report)
    -> std::expected<void, std::error_code> {
  std::ofstream out(path);
  if (!out) {
    return std::unexpected(
        std::make_error_code(std::errc::permission_denied));
  }
  out << report.dump(2) << '\n';
  if (!out) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }
  return {};
}

} // namespace loadcurve
