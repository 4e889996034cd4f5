/// @file test_memory_guard.cpp
/// @brief Memory guard state machine and limit detection.

#include "guard/memory_guard.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace loadcurve;
using namespace std::chrono_literals;

namespace {

/// Fixed limit; usage read from a shared cell the test updates.
class FakeProvider final : public MemoryLimitProvider {
public:
  FakeProvider(std::optional<std::uint64_t> limit,
               std::shared_ptr<std::uint64_t> usage)
      : limit_{limit}, usage_{std::move(usage)} {}

  auto detect_limit() -> std::optional<std::uint64_t> override {
    return limit_;
  }
  auto current_usage() -> std::optional<std::uint64_t> override {
    return *usage_;
  }

private:
  std::optional<std::uint64_t> limit_;
  std::shared_ptr<std::uint64_t> usage_;
};

class MemoryGuardTest : public ::testing::Test {
protected:
  auto make_guard(bool auto_disable = true) -> MemoryGuard {
    MemoryGuardConfig cfg;
    cfg.auto_disable = auto_disable;
    return MemoryGuard{cfg, engine,
                       std::make_unique<FakeProvider>(1000, usage)};
  }

  std::shared_ptr<EngineContext> engine = EngineContext::create();
  std::shared_ptr<std::uint64_t> usage = std::make_shared<std::uint64_t>(0);
};

} // namespace

TEST_F(MemoryGuardTest, BelowWarningDoesNothing) {
  auto guard = make_guard();
  ASSERT_TRUE(guard.initialize());
  *usage = 500;
  EXPECT_EQ(guard.tick(), GuardAction::None);
  EXPECT_TRUE(engine->tracking_active());
  EXPECT_DOUBLE_EQ(guard.state().last_usage_percent, 50.0);
}

TEST_F(MemoryGuardTest, WarningDisablesTrackingAndRotates) {
  auto guard = make_guard();
  ASSERT_TRUE(guard.initialize());
  engine->request_latency().record("GET /", 5.0);

  *usage = 850;
  EXPECT_EQ(guard.tick(), GuardAction::Warning);
  EXPECT_FALSE(engine->tracking_active());
  EXPECT_TRUE(guard.state().disabled_at.has_value());
  EXPECT_FALSE(engine->request_latency().stats("GET /").has_value());

  // Latched: staying above warning does not fire again.
  EXPECT_EQ(guard.tick(), GuardAction::None);
  EXPECT_EQ(guard.state().warnings, 1u);
}

TEST_F(MemoryGuardTest, JumpStraightToCritical) {
  auto guard = make_guard();
  ASSERT_TRUE(guard.initialize());
  *usage = 950;
  EXPECT_EQ(guard.tick(), GuardAction::WarningAndCritical);
  EXPECT_TRUE(guard.state().warning_triggered);
  EXPECT_TRUE(guard.state().critical_triggered);
  EXPECT_FALSE(engine->tracking_active());
}

TEST_F(MemoryGuardTest, CriticalAfterWarning) {
  auto guard = make_guard();
  ASSERT_TRUE(guard.initialize());
  EXPECT_EQ(guard.evaluate(82.0), GuardAction::Warning);
  EXPECT_EQ(guard.evaluate(91.0), GuardAction::Critical);
  EXPECT_EQ(guard.evaluate(95.0), GuardAction::None);
  EXPECT_EQ(guard.state().criticals, 1u);
}

TEST_F(MemoryGuardTest, HysteresisReArmsButTrackingStaysOff) {
  auto guard = make_guard();
  ASSERT_TRUE(guard.initialize());
  EXPECT_EQ(guard.evaluate(85.0), GuardAction::Warning);
  EXPECT_EQ(guard.evaluate(75.0), GuardAction::None); // Within the band.
  EXPECT_EQ(guard.evaluate(69.0), GuardAction::Reset);
  EXPECT_FALSE(guard.state().warning_triggered);
  EXPECT_FALSE(engine->tracking_active());

  EXPECT_EQ(guard.evaluate(81.0), GuardAction::Warning);
  EXPECT_EQ(guard.state().warnings, 2u);
}

TEST_F(MemoryGuardTest, WithoutAutoDisableOnlyLogs) {
  auto guard = make_guard(false);
  ASSERT_TRUE(guard.initialize());
  engine->request_latency().record("GET /", 5.0);
  EXPECT_EQ(guard.evaluate(95.0), GuardAction::WarningAndCritical);
  EXPECT_TRUE(engine->tracking_active());
  EXPECT_FALSE(guard.state().disabled_at.has_value());
  EXPECT_TRUE(engine->request_latency().stats("GET /").has_value());
}

TEST(MemoryGuardNoLimitTest, MissingLimitDeactivates) {
  auto engine = EngineContext::create();
  MemoryGuard guard{MemoryGuardConfig{}, engine,
                    std::make_unique<FakeProvider>(
                        std::nullopt, std::make_shared<std::uint64_t>(0))};
  EXPECT_FALSE(guard.initialize());
  EXPECT_FALSE(guard.state().active);
  EXPECT_FALSE(guard.tick().has_value());
}

TEST(MemoryGuardNoLimitTest, RunReturnsImmediatelyWithoutLimit) {
  auto engine = EngineContext::create();
  MemoryGuard guard{MemoryGuardConfig{}, engine,
                    std::make_unique<FakeProvider>(
                        std::nullopt, std::make_shared<std::uint64_t>(0))};
  net::io_context ioc;
  bool done = false;
  net::co_spawn(ioc, guard.run(MemoryGuard::Clock::now() + 10s),
                [&](std::exception_ptr) { done = true; });
  const auto start = std::chrono::steady_clock::now();
  ioc.run();
  EXPECT_TRUE(done);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
}

TEST(MemoryGuardRunTest, PollsUntilDeadline) {
  auto engine = EngineContext::create();
  auto usage = std::make_shared<std::uint64_t>(900);
  MemoryGuardConfig cfg;
  cfg.interval = 10ms;
  MemoryGuard guard{cfg, engine, std::make_unique<FakeProvider>(1000, usage)};

  net::io_context ioc;
  net::co_spawn(ioc, guard.run(MemoryGuard::Clock::now() + 60ms),
                net::detached);
  ioc.run();
  EXPECT_TRUE(guard.state().active);
  EXPECT_TRUE(guard.state().critical_triggered);
  EXPECT_FALSE(engine->tracking_active());
}

// ─── ProcMemoryProvider against a fixture tree ──────────────────────────

#ifdef __linux__

class ProcProviderTest : public ::testing::Test {
protected:
  void SetUp() override {
    root = std::filesystem::temp_directory_path() /
           ("loadcurve_proc_" + std::to_string(::testing::UnitTest::GetInstance()
                                                   ->random_seed()) +
            "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(root / "proc/self");
    std::filesystem::create_directories(root / "sys/fs/cgroup/memory");
    write("proc/meminfo", "MemTotal:       2048 kB\nMemFree: 1 kB\n");
    write("proc/self/statm", "100 10 5 1 0 20 0\n");
  }
  void TearDown() override { std::filesystem::remove_all(root); }

  void write(const std::string &rel, const std::string &text) {
    std::ofstream out(root / rel);
    out << text;
  }

  std::filesystem::path root;
};

TEST_F(ProcProviderTest, FallsBackToMeminfo) {
  ProcMemoryProvider p{root};
  EXPECT_EQ(p.detect_limit(), 2048u * 1024u);
  EXPECT_EQ(p.limit_source(), "system memory");
}

TEST_F(ProcProviderTest, PrefersCgroupV2) {
  write("sys/fs/cgroup/memory.max", "536870912\n");
  ProcMemoryProvider p{root};
  EXPECT_EQ(p.detect_limit(), 536870912u);
  EXPECT_EQ(p.limit_source(), "cgroup v2");
}

TEST_F(ProcProviderTest, UnlimitedCgroupsFallThrough) {
  write("sys/fs/cgroup/memory.max", "max\n");
  write("sys/fs/cgroup/memory/memory.limit_in_bytes", "9223372036854771712\n");
  ProcMemoryProvider p{root};
  EXPECT_EQ(p.detect_limit(), 2048u * 1024u);
}

TEST_F(ProcProviderTest, CgroupV1Limit) {
  write("sys/fs/cgroup/memory/memory.limit_in_bytes", "1073741824\n");
  ProcMemoryProvider p{root};
  EXPECT_EQ(p.detect_limit(), 1073741824u);
  EXPECT_EQ(p.limit_source(), "cgroup v1");
}

TEST_F(ProcProviderTest, UsageFromResidentPages) {
  ProcMemoryProvider p{root};
  auto usage = p.current_usage();
  ASSERT_TRUE(usage.has_value());
  EXPECT_EQ(*usage % 10, 0u);
  EXPECT_GE(*usage, 10u * 1024u);
}

#endif
