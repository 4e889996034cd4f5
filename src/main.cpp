/// @file main.cpp
/// @brief Command-line entry point: loads a plan, runs it against the
///        target and prints the report.

#include "config/file_watcher.hpp"
#include "config/plan_loader.hpp"
#include "engine/config_channel.hpp"
#include "engine/engine_context.hpp"
#include "engine/load_runner.hpp"
#include "guard/memory_guard.hpp"
#include "http/beast_client.hpp"
#include "report/report.hpp"

#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

using namespace loadcurve;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct CliArgs {
  std::optional<std::filesystem::path> plan;
  std::optional<std::string> url;
  std::optional<std::size_t> workers;
  std::optional<std::string> duration;
  std::size_t threads = 0; // 0 = hardware concurrency.
  bool watch = false;
  std::optional<std::filesystem::path> json_report;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options]\n\n"
      << "Options:\n"
      << "  --plan <FILE>         JSON test plan\n"
      << "  --url <URL>           Target base URL (overrides the plan)\n"
      << "  --workers <N>         Worker count (overrides the plan)\n"
      << "  --duration <D>        Run length, e.g. 30s, 5m (overrides the "
         "plan)\n"
      << "  --threads <N>         I/O threads (default: hardware "
         "concurrency)\n"
      << "  --watch               Reload the plan file when it changes\n"
      << "  --json-report <FILE>  Also write the report as JSON\n"
      << "  --help                Show this help\n\n"
      << "Without --plan, --url is required and every worker sends GET "
         "requests\n"
      << "to it as fast as responses come back.\n";
}

auto parse_args(int argc, char *argv[]) -> std::optional<CliArgs> {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--plan" && i + 1 < argc) {
      args.plan = argv[++i];
    } else if (arg == "--url" && i + 1 < argc) {
      args.url = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      args.workers = std::stoull(argv[++i]);
    } else if (arg == "--duration" && i + 1 < argc) {
      args.duration = argv[++i];
    } else if (arg == "--threads" && i + 1 < argc) {
      args.threads = std::stoull(argv[++i]);
    } else if (arg == "--watch") {
      args.watch = true;
    } else if (arg == "--json-report" && i + 1 < argc) {
      args.json_report = argv[++i];
    } else {
      std::cerr << "Unknown or incomplete option: " << arg << '\n';
      return std::nullopt;
    }
  }
  return args;
}

auto build_plan(const CliArgs &args) -> std::expected<LoadedPlan, ConfigError> {
  LoadedPlan loaded;
  if (args.plan) {
    auto from_file = load_plan_file(*args.plan);
    if (!from_file) {
      return std::unexpected(from_file.error());
    }
    loaded = std::move(*from_file);
  } else {
    if (!args.url) {
      return std::unexpected(
          ConfigError{"url", "either --plan or --url is required"});
    }
    loaded.plan.request = RequestConfig{.method = "GET", .path = "/"};
  }

  if (args.url) {
    loaded.plan.base_url = *args.url;
  }
  if (args.workers) {
    if (*args.workers == 0) {
      return std::unexpected(ConfigError{"workers", "must be at least 1"});
    }
    loaded.plan.workers = *args.workers;
  }
  if (args.duration) {
    auto d = parse_duration(*args.duration);
    if (!d) {
      return std::unexpected(d.error());
    }
    loaded.plan.duration = *d;
  }
  return loaded;
}

} // namespace

int main(int argc, char *argv[]) {
  auto args = parse_args(argc, argv);
  if (!args) {
    print_usage(argv[0]);
    return 1;
  }
  if (args->watch && !args->plan) {
    std::cerr << "[Config] --watch requires --plan\n";
    return 1;
  }

  auto loaded = build_plan(*args);
  if (!loaded) {
    std::cerr << "[Config] " << describe(loaded.error()) << '\n';
    return 1;
  }
  for (const auto &w : loaded->warnings) {
    std::cerr << "[Config] Warning: " << w << '\n';
  }

  auto plan = std::make_shared<const RunPlan>(std::move(loaded->plan));

  auto engine = EngineContext::create();
  engine->set_initial_tracking(plan->percentiles);
  auto channel = std::make_shared<ConfigChannel>(plan);
  auto client = std::make_shared<BeastHttpClient>(plan->request_timeout);

  std::cout << "[LoadCurve] Target " << plan->base_url << ", "
            << plan->workers << " workers, " << describe(plan->load) << ", "
            << plan->duration.count() << " s\n";

  std::unique_ptr<FileWatcher> watcher;
  if (args->watch) {
    watcher = std::make_unique<FileWatcher>(*args->plan, channel);
    watcher->start();
  }

  RunSummary summary;
  try {
    LoadRunner runner(channel, engine, client,
                      std::make_unique<ProcMemoryProvider>(), args->threads);
    summary = runner.run();
    // No reload may reach the runner's workers once it leaves scope.
    if (watcher) {
      watcher->stop();
    }
  } catch (const std::exception &e) {
    std::cerr << "[LoadCurve] Run aborted: " << e.what() << '\n';
    if (watcher) {
      watcher->stop();
    }
    return 1;
  }

  // Report against the plan in force at the end of the run.
  const auto final_plan = channel->current();
  print_report(std::cout, *final_plan, summary, *engine);

  if (args->json_report) {
    auto written = write_json_report(
        *args->json_report, build_json_report(*final_plan, summary, *engine));
    if (!written) {
      std::cerr << "[LoadCurve] Failed to write " << args->json_report->string()
                << ": " << written.error().message() << '\n';
      return 1;
    }
    std::cout << "[LoadCurve] JSON report written to "
              << args->json_report->string() << '\n';
  }
  return 0;
}
