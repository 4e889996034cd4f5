/// @file memory_guard.cpp
/// @brief Memory limit detection and the guard state machine.

#include "guard/memory_guard.hpp"
#include "metrics/format.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

#ifdef __linux__
#include <unistd.h>
#endif

namespace loadcurve {

namespace {

auto read_file(const std::filesystem::path &path)
    -> std::optional<std::string> {
  std::ifstream in(path);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

auto parse_u64(std::string_view s) -> std::optional<std::uint64_t> {
  while (!s.empty() && (s.back() == '\n' || s.back() == ' ')) {
    s.remove_suffix(1);
  }
  while (!s.empty() && s.front() == ' ') {
    s.remove_prefix(1);
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || ec != std::errc{}) {
    return std::nullopt;
  }
  return value;
}

auto percent(double v) -> std::string {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v << "%";
  return ss.str();
}

} // namespace

// ─── ProcMemoryProvider ─────────────────────────────────────────────────

ProcMemoryProvider::ProcMemoryProvider(std::filesystem::path root)
    : root_{std::move(root)} {}

auto ProcMemoryProvider::detect_limit() -> std::optional<std::uint64_t> {
#ifdef __linux__
  // cgroup v2 writes "max" when unlimited, which fails to parse.
  if (auto text = read_file(root_ / "sys/fs/cgroup/memory.max")) {
    if (auto v = parse_u64(*text); v && *v != UINT64_MAX) {
      limit_source_ = "cgroup v2";
      return v;
    }
  }

  if (auto text = read_file(root_ / "sys/fs/cgroup/memory/memory.limit_in_bytes")) {
    if (auto v = parse_u64(*text); v && *v < (std::uint64_t{1} << 60)) {
      limit_source_ = "cgroup v1";
      return v;
    }
  }

  if (auto text = read_file(root_ / "proc/meminfo")) {
    std::istringstream lines(*text);
    std::string line;
    while (std::getline(lines, line)) {
      if (!line.starts_with("MemTotal:")) {
        continue;
      }
      std::istringstream fields(line.substr(9));
      std::uint64_t kb = 0;
      if (fields >> kb) {
        limit_source_ = "system memory";
        return kb * 1024;
      }
    }
  }
#endif
  return std::nullopt;
}

auto ProcMemoryProvider::current_usage() -> std::optional<std::uint64_t> {
#ifdef __linux__
  auto text = read_file(root_ / "proc/self/statm");
  if (!text) {
    return std::nullopt;
  }
  std::istringstream fields(*text);
  std::uint64_t size_pages = 0;
  std::uint64_t resident_pages = 0;
  if (!(fields >> size_pages >> resident_pages)) {
    return std::nullopt;
  }
  const long page = ::sysconf(_SC_PAGESIZE);
  return resident_pages * static_cast<std::uint64_t>(page > 0 ? page : 4096);
#else
  return std::nullopt;
#endif
}

// ─── MemoryGuard ────────────────────────────────────────────────────────

auto to_string(GuardAction a) -> const char * {
  switch (a) {
  case GuardAction::None:
    return "none";
  case GuardAction::Warning:
    return "warning";
  case GuardAction::Critical:
    return "critical";
  case GuardAction::WarningAndCritical:
    return "warning+critical";
  case GuardAction::Reset:
    return "reset";
  }
  return "unknown";
}

MemoryGuard::MemoryGuard(MemoryGuardConfig cfg,
                         std::shared_ptr<EngineContext> engine,
                         std::unique_ptr<MemoryLimitProvider> provider)
    : cfg_{cfg}, engine_{std::move(engine)}, provider_{std::move(provider)} {}

auto MemoryGuard::initialize() -> bool {
  limit_ = provider_ ? provider_->detect_limit() : std::nullopt;
  if (!limit_ || *limit_ == 0) {
    limit_.reset();
    state_.active = false;
    std::cerr << "[MemoryGuard] Memory limit could not be determined; "
                 "guard disabled\n";
    return false;
  }
  state_.active = true;
  std::cout << "[MemoryGuard] Limit " << format_bytes(*limit_)
            << ", warning at " << percent(cfg_.warning_percent)
            << ", critical at " << percent(cfg_.critical_percent)
            << (cfg_.auto_disable ? "" : " (auto-disable off)") << "\n";
  return true;
}

auto MemoryGuard::evaluate(double usage_percent) -> GuardAction {
  state_.last_usage_percent = usage_percent;
  bool warned = false;
  bool critical = false;

  if (usage_percent >= cfg_.critical_percent && !state_.critical_triggered) {
    state_.critical_triggered = true;
    ++state_.criticals;
    critical = true;
    std::cerr << "[MemoryGuard] CRITICAL: usage at " << percent(usage_percent)
              << " of limit\n";
    if (cfg_.auto_disable) {
      engine_->rotate_histograms();
    }
  }

  if (usage_percent >= cfg_.warning_percent && !state_.warning_triggered) {
    state_.warning_triggered = true;
    ++state_.warnings;
    warned = true;
    std::cerr << "[MemoryGuard] Warning: usage at " << percent(usage_percent)
              << " of limit\n";
    if (cfg_.auto_disable) {
      engine_->disable_tracking();
      if (!state_.disabled_at) {
        state_.disabled_at = Clock::now();
      }
      engine_->rotate_histograms();
      std::cerr << "[MemoryGuard] Latency tracking disabled and histograms "
                   "rotated for the rest of the run\n";
    }
  }

  if (warned && critical) {
    return GuardAction::WarningAndCritical;
  }
  if (critical) {
    return GuardAction::Critical;
  }
  if (warned) {
    return GuardAction::Warning;
  }

  if (state_.warning_triggered &&
      usage_percent < cfg_.warning_percent - kHysteresisPercent) {
    state_.warning_triggered = false;
    state_.critical_triggered = false;
    std::cout << "[MemoryGuard] Usage back to " << percent(usage_percent)
              << "; thresholds re-armed, tracking stays "
              << (engine_->tracking_active() ? "on" : "off") << "\n";
    return GuardAction::Reset;
  }

  return GuardAction::None;
}

auto MemoryGuard::tick() -> std::optional<GuardAction> {
  if (!state_.active || !limit_) {
    return std::nullopt;
  }
  auto usage = provider_->current_usage();
  if (!usage) {
    return std::nullopt;
  }
  const double pct = static_cast<double>(*usage) /
                     static_cast<double>(*limit_) * 100.0;
  return evaluate(pct);
}

auto MemoryGuard::run(Clock::time_point deadline) -> net::awaitable<void> {
  if (!state_.active && !initialize()) {
    co_return;
  }

  net::steady_timer timer{co_await net::this_coro::executor};
  while (!stopped_.load(std::memory_order_relaxed) &&
         Clock::now() < deadline) {
    (void)tick();

    const auto next = std::min(Clock::now() + cfg_.interval, deadline);
    timer.expires_at(next);
    beast::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec == net::error::operation_aborted) {
      break;
    }
  }
}

} // namespace loadcurve
