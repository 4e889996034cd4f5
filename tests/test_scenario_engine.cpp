/// @file test_scenario_engine.cpp
/// @brief Scenario execution against a scripted HTTP client.

#include "scenario/scenario_engine.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace loadcurve;
using namespace loadcurve::testing;
using namespace std::chrono_literals;

namespace {

auto step(std::string name, std::string path) -> Step {
  Step s;
  s.name = std::move(name);
  s.request.path = std::move(path);
  return s;
}

auto engine_for(std::shared_ptr<FakeHttpClient> client) -> ScenarioEngine {
  return ScenarioEngine{std::move(client),
                        ScenarioEngineConfig{.base_url = "http://target:8080",
                                             .request_timeout = 2s}};
}

} // namespace

TEST(ScenarioEngineTest, AllStepsSucceed) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return ok(); });
  auto engine = engine_for(client);

  Scenario sc{.name = "browse",
              .weight = 1.0,
              .steps = {step("home", "/"), step("list", "/items")},
              .data = nullptr};
  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.steps_completed, 2u);
  EXPECT_FALSE(result.failed_at_step.has_value());
  ASSERT_EQ(result.steps.size(), 2u);
  EXPECT_EQ(result.steps[1].status, 200);

  auto sent = client->requests();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[1].url, "http://target:8080/items");
  EXPECT_EQ(sent[1].timeout, 2s);
}

TEST(ScenarioEngineTest, FailedAssertionStopsScenario) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return status(404); });
  auto engine = engine_for(client);

  auto first = step("missing", "/nope");
  first.assertions.push_back(assertion::StatusCode{200});
  Scenario sc{.name = "s",
              .weight = 1.0,
              .steps = {first, step("never", "/after")},
              .data = nullptr};

  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.steps_completed, 1u);
  EXPECT_EQ(result.failed_at_step, 0u);
  ASSERT_EQ(result.steps.size(), 1u);
  EXPECT_EQ(result.steps[0].status, 404);
  EXPECT_EQ(result.steps[0].assertions_failed, 1u);
  EXPECT_EQ(client->request_count(), 1u);
}

TEST(ScenarioEngineTest, NonSuccessStatusWithoutAssertionsPasses) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return status(500); });
  auto engine = engine_for(client);
  Scenario sc{.name = "s", .weight = 1.0, .steps = {step("a", "/")},
              .data = nullptr};
  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));
  EXPECT_TRUE(result.success);
}

TEST(ScenarioEngineTest, TransportErrorFailsStep) {
  auto client = std::make_shared<FakeHttpClient>([](const HttpRequest &) {
    return HttpResult{std::unexpected(TransportError{
        .kind = TransportErrorKind::Connect, .message = "refused"})};
  });
  auto engine = engine_for(client);
  Scenario sc{.name = "s",
              .weight = 1.0,
              .steps = {step("a", "/"), step("b", "/")},
              .data = nullptr};
  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed_at_step, 0u);
  ASSERT_EQ(result.steps.size(), 1u);
  EXPECT_FALSE(result.steps[0].status.has_value());
  ASSERT_TRUE(result.steps[0].transport_error.has_value());
  EXPECT_EQ(result.steps[0].transport_error->kind, TransportErrorKind::Connect);
  EXPECT_TRUE(result.steps[0].error.has_value());
}

TEST(ScenarioEngineTest, ExtractedVariableFlowsIntoNextStep) {
  auto client = std::make_shared<FakeHttpClient>([](const HttpRequest &req) {
    if (req.url.ends_with("/login")) {
      return ok(R"({"token":"tok-1","user":{"id":7}})");
    }
    return ok();
  });
  auto engine = engine_for(client);

  auto login = step("login", "/login");
  login.request.method = "post";
  login.request.body = R"({"user":"${user}"})";
  login.extractions.push_back({"token", JsonPathExtractor{"$.token"}});
  login.extractions.push_back({"uid", JsonPathExtractor{"$.user.id"}});

  auto profile = step("profile", "/users/${uid}");
  profile.request.headers["Authorization"] = "Bearer ${token}";

  Scenario sc{.name = "auth", .weight = 1.0, .steps = {login, profile},
              .data = nullptr};
  VariableContext ctx;
  ctx.set("user", "alice");
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));
  ASSERT_TRUE(result.success);

  auto sent = client->requests();
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].method, "POST");
  EXPECT_EQ(sent[0].body, R"({"user":"alice"})");
  EXPECT_EQ(sent[1].url, "http://target:8080/users/7");
  ASSERT_EQ(sent[1].headers.size(), 1u);
  EXPECT_EQ(sent[1].headers[0].second, "Bearer tok-1");
}

TEST(ScenarioEngineTest, FailedStepDoesNotExtract) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return ok(R"({"token":"x"})"); });
  auto engine = engine_for(client);

  auto s = step("a", "/");
  s.assertions.push_back(assertion::StatusCode{201});
  s.extractions.push_back({"token", JsonPathExtractor{"$.token"}});
  Scenario sc{.name = "s", .weight = 1.0, .steps = {s}, .data = nullptr};

  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(ctx.contains("token"));
}

TEST(ScenarioEngineTest, CookiesCarryAcrossStepsAndExecutions) {
  auto client = std::make_shared<FakeHttpClient>([](const HttpRequest &req) {
    if (req.url.ends_with("/login")) {
      return ok("{}", {{"Set-Cookie", "sid=s1; HttpOnly"}});
    }
    return ok();
  });
  auto engine = engine_for(client);

  Scenario login{.name = "login", .weight = 1.0,
                 .steps = {step("login", "/login"), step("me", "/me")},
                 .data = nullptr};
  Scenario later{.name = "later", .weight = 1.0, .steps = {step("x", "/x")},
                 .data = nullptr};

  SessionStore session;
  VariableContext ctx1;
  (void)run_sync(engine.execute(login, ctx1, session));
  VariableContext ctx2;
  (void)run_sync(engine.execute(later, ctx2, session));

  auto sent = client->requests();
  ASSERT_EQ(sent.size(), 3u);
  EXPECT_TRUE(sent[0].headers.empty());
  ASSERT_EQ(sent[1].headers.size(), 1u);
  EXPECT_EQ(sent[1].headers[0].first, "Cookie");
  EXPECT_EQ(sent[1].headers[0].second, "sid=s1");
  ASSERT_EQ(sent[2].headers.size(), 1u);
  EXPECT_EQ(sent[2].headers[0].second, "sid=s1");
}

TEST(ScenarioEngineTest, ExplicitCookieHeaderMergesWithJar) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return ok(); });
  auto engine = engine_for(client);

  RequestConfig cfg;
  cfg.path = "/";
  cfg.headers["Cookie"] = "theme=${theme}";
  VariableContext ctx;
  ctx.set("theme", "dark");
  SessionStore session;
  session.apply_set_cookie("sid=abc");

  auto req = engine.build_request(cfg, ctx, session);
  ASSERT_EQ(req.headers.size(), 1u);
  EXPECT_EQ(req.headers[0].second, "theme=dark; sid=abc");
}

TEST(ScenarioEngineTest, PassedDeadlineInterruptsBetweenSteps) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return ok(); });
  auto engine = engine_for(client);
  Scenario sc{.name = "s",
              .weight = 1.0,
              .steps = {step("a", "/a"), step("b", "/b")},
              .data = nullptr};
  VariableContext ctx;
  SessionStore session;

  // Already past: the first step still runs, the second is skipped.
  auto result = run_sync(engine.execute(sc, ctx, session,
                                        ScenarioEngine::Clock::now() - 1s));
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.interrupted);
  EXPECT_EQ(result.steps_completed, 1u);
  EXPECT_FALSE(result.failed_at_step.has_value());
  EXPECT_EQ(client->request_count(), 1u);
}

TEST(ScenarioEngineTest, ThinkTimeDelaysNextStep) {
  auto client = std::make_shared<FakeHttpClient>(
      [](const HttpRequest &) { return ok(); });
  auto engine = engine_for(client);

  auto first = step("a", "/a");
  first.think_time = FixedThinkTime{50ms};
  Scenario sc{.name = "s", .weight = 1.0, .steps = {first, step("b", "/b")},
              .data = nullptr};
  VariableContext ctx;
  SessionStore session;
  auto result = run_sync(engine.execute(sc, ctx, session));
  EXPECT_TRUE(result.success);
  EXPECT_GE(result.total_elapsed_ms, 50.0);
  EXPECT_LT(result.steps[0].elapsed_ms, 50.0);
}
