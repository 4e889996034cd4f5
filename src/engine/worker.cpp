/// @file worker.cpp
/// @brief Worker pacing loop and per-unit recording.

#include "engine/worker.hpp"
#include "http/url.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace loadcurve {

namespace {

auto secs_since(std::chrono::steady_clock::time_point from) -> double {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - from)
      .count();
}

auto ms_since(std::chrono::steady_clock::time_point from) -> double {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - from)
      .count();
}

auto category_for(const StepResult &step) -> std::optional<ErrorCategory> {
  if (step.transport_error) {
    return categorize(*step.transport_error);
  }
  if (step.status) {
    return categorize_status(*step.status);
  }
  return ErrorCategory::OtherError;
}

} // namespace

Worker::Worker(WorkerConfig cfg, Executor strand,
               std::shared_ptr<EngineContext> engine,
               std::shared_ptr<ConfigChannel> channel,
               std::shared_ptr<HttpClient> client)
    : cfg_{cfg}, strand_{std::move(strand)}, engine_{std::move(engine)},
      channel_{std::move(channel)}, client_{std::move(client)},
      pacer_{strand_} {}

auto Worker::stagger_offset(std::size_t id, std::size_t count,
                            std::chrono::milliseconds cycle)
    -> std::chrono::milliseconds {
  if (count == 0 || cycle.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{
      cycle.count() * static_cast<std::int64_t>(id % count) /
      static_cast<std::int64_t>(count)};
}

void Worker::wake() {
  net::post(strand_, [this] {
    if (parked_) {
      pacer_.cancel();
    }
  });
}

void Worker::refresh_plan() {
  const auto version = channel_->version();
  if (plan_ && version == plan_version_) {
    return;
  }
  auto next = channel_->current();
  if (plan_ && cfg_.id == 0) {
    std::cout << "[Worker 0] Picked up plan v" << version << ": "
              << describe(next->load) << "\n";
  }
  plan_ = std::move(next);
  plan_version_ = version;
  scenarios_.emplace(client_, ScenarioEngineConfig{
                                  .base_url = plan_->base_url,
                                  .request_timeout = plan_->request_timeout,
                              });
}

auto Worker::pause_until(Clock::time_point when) -> net::awaitable<void> {
  if (when <= Clock::now()) {
    co_return;
  }
  pacer_.expires_at(when);
  beast::error_code ec;
  co_await pacer_.async_wait(net::redirect_error(net::use_awaitable, ec));
}

void Worker::record_latency(MultiLabelLatencyTracker &tracker,
                            const std::string &label, double elapsed_ms) {
  if (!engine_->tracking_active()) {
    engine_->note_skipped();
    return;
  }
  if (engine_->should_sample(plan_->sampling_rate)) {
    tracker.record(label, elapsed_ms);
  }
}

void Worker::log_transport_failure(const TransportError &error) {
  const auto bit = static_cast<std::size_t>(error.kind);
  if (logged_kinds_.test(bit)) {
    return;
  }
  logged_kinds_.set(bit);
  std::cerr << "[Worker " << cfg_.id << "] " << describe(error)
            << " (further " << to_string(error.kind)
            << " errors from this worker are counted, not logged)\n";
}

auto Worker::run_request(const RequestConfig &request)
    -> net::awaitable<bool> {
  HttpRequest req;
  req.method = request.method;
  req.url = join_url(plan_->base_url, request.path);
  req.timeout = plan_->request_timeout;
  req.body = request.body;
  req.discard_body = true;
  for (const auto &[k, v] : request.headers) {
    req.headers.emplace_back(k, v);
  }

  const auto label = request.method + " " + request.path;
  const auto start = Clock::now();
  auto res = co_await client_->send(std::move(req));
  const double elapsed = ms_since(start);

  engine_->throughput().record_ms(label, elapsed);
  record_latency(engine_->request_latency(), label, elapsed);

  RequestOutcome outcome{.label = label, .elapsed_ms = elapsed};
  bool ok = true;
  if (res.has_value()) {
    outcome.status = res->status;
    outcome.category = categorize_status(res->status);
    ok = !outcome.category.has_value();
  } else {
    outcome.category = categorize(res.error());
    log_transport_failure(res.error());
    ok = false;
  }
  engine_->emit(outcome);
  co_return ok;
}

auto Worker::run_scenario(const Scenario &scenario) -> net::awaitable<bool> {
  VariableContext context;
  if (scenario.data) {
    context.load_row(scenario.data->next_row());
  }

  auto result =
      co_await scenarios_->execute(scenario, context, session_, cfg_.deadline);

  ScenarioOutcome outcome{
      .scenario_name = result.scenario_name,
      .success = result.success,
      .interrupted = result.interrupted,
      .total_elapsed_ms = result.total_elapsed_ms,
      .failed_at_step = result.failed_at_step,
  };
  outcome.step_elapsed_ms.reserve(result.steps.size());

  for (const auto &step : result.steps) {
    const auto label = scenario.name + ":" + step.name;
    outcome.step_elapsed_ms.emplace_back(step.name, step.elapsed_ms);
    record_latency(engine_->step_latency(), label, step.elapsed_ms);
    engine_->emit(RequestOutcome{
        .label = label,
        .status = step.status,
        .category = category_for(step),
        .elapsed_ms = step.elapsed_ms,
    });
    if (step.transport_error) {
      log_transport_failure(*step.transport_error);
    }
  }

  engine_->throughput().record_ms(scenario.name, result.total_elapsed_ms);
  if (!result.interrupted) {
    record_latency(engine_->scenario_latency(), scenario.name,
                   result.total_elapsed_ms);
  }
  engine_->emit(outcome);
  co_return result.success || result.interrupted;
}

auto Worker::run_once() -> net::awaitable<bool> {
  if (plan_->selector) {
    // Hold the scenario alive even if a new plan is published mid-run.
    auto scenario = plan_->selector->select();
    co_return co_await run_scenario(*scenario);
  }
  if (plan_->request) {
    co_return co_await run_request(*plan_->request);
  }
  co_return false;
}

auto Worker::run() -> net::awaitable<WorkerStats> {
  refresh_plan();
  const double total = plan_->duration.count();

  // Spread the first requests across one pacing cycle.
  auto next_fire = cfg_.start;
  if (auto delay = pacing_delay(current_rate(plan_->load, 0.0, total),
                                cfg_.worker_count);
      delay && delay->count() > 0) {
    next_fire += stagger_offset(cfg_.id, cfg_.worker_count, *delay);
  }
  co_await pause_until(std::min(next_fire, cfg_.deadline));

  while (Clock::now() < cfg_.deadline) {
    refresh_plan();

    const double rate =
        current_rate(plan_->load, secs_since(cfg_.start), total);
    const auto delay = pacing_delay(rate, cfg_.worker_count);

    if (!delay.has_value()) {
      ++stats_.parked;
      parked_ = true;
      co_await pause_until(std::min(Clock::now() + kParkInterval,
                                    cfg_.deadline));
      parked_ = false;
      next_fire = Clock::now();
      continue;
    }

    const bool ok = co_await run_once();
    ++stats_.iterations;
    if (!ok) {
      ++stats_.failures;
    }

    const auto now = Clock::now();
    if (delay->count() == 0) {
      next_fire = now;
      // Let other coroutines on this thread run between back-to-back sends.
      co_await net::post(strand_, net::use_awaitable);
      continue;
    }

    next_fire += *delay;
    if (next_fire < now) {
      next_fire = now; // Behind schedule: fire now, do not burst to catch up.
    }
    co_await pause_until(std::min(next_fire, cfg_.deadline));
  }

  co_return stats_;
}

} // namespace loadcurve
