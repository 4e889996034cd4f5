/// @file scenario_engine.cpp
/// @brief Step execution: substitute, send, assert, extract, think.

#include "scenario/scenario_engine.hpp"
#include "core/strings.hpp"
#include "http/url.hpp"
#include "scenario/assertions.hpp"
#include "scenario/extractor.hpp"

#include <iostream>
#include <utility>

namespace loadcurve {

namespace {

auto elapsed_ms(ScenarioEngine::Clock::time_point since) -> double {
  return std::chrono::duration<double, std::milli>(
             ScenarioEngine::Clock::now() - since)
      .count();
}

} // namespace

ScenarioEngine::ScenarioEngine(std::shared_ptr<HttpClient> client,
                               ScenarioEngineConfig cfg)
    : client_{std::move(client)}, cfg_{std::move(cfg)} {}

auto ScenarioEngine::build_request(const RequestConfig &request,
                                   const VariableContext &context,
                                   const SessionStore &session) const
    -> HttpRequest {
  HttpRequest out;
  out.method = to_upper(context.substitute(request.method));
  out.url = join_url(cfg_.base_url, context.substitute(request.path));
  out.timeout = cfg_.request_timeout;
  if (request.body.has_value()) {
    out.body = context.substitute(*request.body);
  }

  std::optional<std::string> explicit_cookie;
  for (const auto &[name, value] : request.headers) {
    auto resolved = context.substitute(value);
    if (iequals(name, "cookie")) {
      explicit_cookie = std::move(resolved);
      continue;
    }
    out.headers.emplace_back(name, std::move(resolved));
  }

  auto jar = session.cookie_header();
  if (explicit_cookie && jar) {
    out.headers.emplace_back("Cookie", *explicit_cookie + "; " + *jar);
  } else if (explicit_cookie) {
    out.headers.emplace_back("Cookie", std::move(*explicit_cookie));
  } else if (jar) {
    out.headers.emplace_back("Cookie", std::move(*jar));
  }

  return out;
}

auto ScenarioEngine::execute_step(const Step &step, VariableContext &context,
                                  SessionStore &session) const
    -> net::awaitable<StepResult> {
  StepResult result;
  result.name = step.name;

  auto request = build_request(step.request, context, session);

  const auto start = Clock::now();
  auto response = co_await client_->send(std::move(request));
  result.elapsed_ms = elapsed_ms(start);

  if (!response.has_value()) {
    result.success = false;
    result.error = describe(response.error());
    result.transport_error = std::move(response.error());
    co_return result;
  }

  result.status = response->status;
  session.update_from_response(response->headers);

  auto report = run_assertions(step.assertions, *response,
                               ElapsedMs{result.elapsed_ms});
  result.assertions_passed = report.passed;
  result.assertions_failed = report.failures.size();
  result.failures = std::move(report.failures);
  result.success = result.failures.empty();

  if (result.success && !step.extractions.empty()) {
    auto extracted = extract_variables(step.extractions, *response, context);
    for (const auto &f : extracted.failures) {
      std::cerr << "[Scenario] Step '" << step.name
                << "' extraction skipped for '" << f.variable
                << "': " << describe(f) << "\n";
    }
  }

  co_return result;
}

auto ScenarioEngine::execute(const Scenario &scenario,
                             VariableContext &context, SessionStore &session,
                             std::optional<Clock::time_point> deadline) const
    -> net::awaitable<ScenarioResult> {
  ScenarioResult result;
  result.scenario_name = scenario.name;
  result.steps.reserve(scenario.steps.size());

  const auto start = Clock::now();
  bool all_ok = true;

  for (std::size_t i = 0; i < scenario.steps.size(); ++i) {
    if (i > 0 && deadline && Clock::now() >= *deadline) {
      result.interrupted = true;
      all_ok = false;
      break;
    }

    const auto &step = scenario.steps[i];
    auto step_result = co_await execute_step(step, context, session);
    ++result.steps_completed;
    const bool ok = step_result.success;
    result.steps.push_back(std::move(step_result));

    if (!ok) {
      all_ok = false;
      result.failed_at_step = i;
      break;
    }

    if (step.think_time.has_value()) {
      const auto delay = resolve_delay(*step.think_time);
      if (delay.count() > 0) {
        net::steady_timer timer{co_await net::this_coro::executor};
        timer.expires_after(delay);
        beast::error_code ec;
        co_await timer.async_wait(
            net::redirect_error(net::use_awaitable, ec));
      }
    }
  }

  result.success = all_ok;
  result.total_elapsed_ms = elapsed_ms(start);
  co_return result;
}

} // namespace loadcurve
