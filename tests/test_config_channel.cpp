/// @file test_config_channel.cpp
/// @brief Plan publication and file-driven reloads.

#include "config/file_watcher.hpp"
#include "engine/config_channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>

using namespace loadcurve;
using namespace std::chrono_literals;

namespace {

auto plan_with_workers(std::size_t n) -> ConfigChannel::PlanPtr {
  RunPlan p;
  p.workers = n;
  p.request = RequestConfig{.method = "GET", .path = "/"};
  return std::make_shared<const RunPlan>(std::move(p));
}

} // namespace

TEST(ConfigChannelTest, PublishBumpsVersionAndNotifies) {
  ConfigChannel channel{plan_with_workers(1)};
  EXPECT_EQ(channel.version(), 1u);

  std::vector<std::uint64_t> seen;
  auto id = channel.subscribe(
      [&](const ConfigChannel::PlanPtr &plan, std::uint64_t version) {
        EXPECT_EQ(plan->workers, 5u);
        seen.push_back(version);
      });

  channel.publish(plan_with_workers(5));
  EXPECT_EQ(channel.version(), 2u);
  EXPECT_EQ(channel.current()->workers, 5u);
  EXPECT_EQ(seen, (std::vector<std::uint64_t>{2}));

  channel.unsubscribe(id);
  channel.publish(plan_with_workers(5));
  EXPECT_EQ(seen.size(), 1u);
}

TEST(ConfigChannelTest, ListenerMayReadChannel) {
  ConfigChannel channel{plan_with_workers(1)};
  std::size_t observed = 0;
  channel.subscribe([&](const ConfigChannel::PlanPtr &, std::uint64_t) {
    observed = channel.current()->workers;
  });
  channel.publish(plan_with_workers(3));
  EXPECT_EQ(observed, 3u);
}

TEST(ConfigChannelTest, UnsubscribeWaitsForRunningListener) {
  ConfigChannel channel{plan_with_workers(1)};
  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic<bool> listener_done{false};

  auto id = channel.subscribe([&](const ConfigChannel::PlanPtr &,
                                  std::uint64_t) {
    entered.set_value();
    released.wait();
    listener_done = true;
  });

  std::thread publisher([&] { channel.publish(plan_with_workers(2)); });
  entered.get_future().wait();

  std::atomic<bool> unsubscribed{false};
  bool done_when_unsubscribed = false;
  std::thread remover([&] {
    channel.unsubscribe(id);
    done_when_unsubscribed = listener_done.load();
    unsubscribed = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(unsubscribed.load());

  release.set_value();
  publisher.join();
  remover.join();
  EXPECT_TRUE(unsubscribed.load());
  EXPECT_TRUE(done_when_unsubscribed);
}

class FileWatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    path = std::filesystem::temp_directory_path() /
           (std::string{"loadcurve_watch_"} +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() +
            ".json");
    write(R"({"config":{"workers":2},"request":{"path":"/"}})");
  }
  void TearDown() override { std::filesystem::remove(path); }

  void write(const std::string &text) {
    {
      std::ofstream out(path);
      out << text;
    }
    // Force a distinct mtime regardless of filesystem timestamp resolution.
    bump_ += 2s;
    std::filesystem::last_write_time(
        path, std::filesystem::file_time_type::clock::now() + bump_);
  }

  /// The watch is armed on the watcher thread; give it a moment.
  static void wait_until_watching(const FileWatcher &watcher) {
#ifdef __linux__
    for (int i = 0; i < 200 && !watcher.event_driven(); ++i) {
      std::this_thread::sleep_for(5ms);
    }
#else
    (void)watcher;
#endif
  }

  std::filesystem::path path;
  std::chrono::seconds bump_{0};
};

TEST_F(FileWatcherTest, UnchangedFileIsIgnored) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel};
  EXPECT_FALSE(watcher.poll());
  EXPECT_EQ(channel->version(), 1u);
}

TEST_F(FileWatcherTest, ChangedFileIsPublished) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel};

  write(R"({"config":{"workers":2},"load":{"model":"rps","target":40},
            "request":{"path":"/health"}})");
  EXPECT_TRUE(watcher.poll());
  EXPECT_EQ(channel->version(), 2u);
  EXPECT_EQ(channel->current()->request->path, "/health");
  EXPECT_EQ(watcher.reloads(), 1u);
}

TEST_F(FileWatcherTest, InvalidReloadKeepsCurrentPlan) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel};

  write(R"({"load":{"model":"rps","target":-1},"request":{"path":"/"}})");
  EXPECT_FALSE(watcher.poll());
  EXPECT_EQ(channel->version(), 1u);
  EXPECT_EQ(watcher.reloads(), 0u);
}

TEST_F(FileWatcherTest, BackgroundThreadPicksUpChange) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel, 10ms};
  watcher.start();
  wait_until_watching(watcher);
  write(R"({"request":{"path":"/bg"}})");

  for (int i = 0; i < 200 && channel->version() == 1; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  watcher.stop();
  // The content write and the mtime change may each publish.
  EXPECT_GE(channel->version(), 2u);
  EXPECT_EQ(channel->current()->request->path, "/bg");
}

#ifdef __linux__
TEST_F(FileWatcherTest, ChangeIsSeenWithoutWaitingForInterval) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel, std::chrono::hours{1}};
  watcher.start();
  wait_until_watching(watcher);
  ASSERT_TRUE(watcher.event_driven());

  write(R"({"request":{"path":"/pushed"}})");
  for (int i = 0; i < 400 && channel->version() == 1; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  watcher.stop();
  EXPECT_GE(channel->version(), 2u);
  EXPECT_EQ(channel->current()->request->path, "/pushed");
}

TEST_F(FileWatcherTest, ReplacedByRenameIsSeen) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel, std::chrono::hours{1}};
  watcher.start();
  wait_until_watching(watcher);

  auto staged = path;
  staged += ".tmp";
  {
    std::ofstream out(staged);
    out << R"({"request":{"path":"/renamed"}})";
  }
  std::filesystem::last_write_time(
      staged, std::filesystem::file_time_type::clock::now() + 1h);
  std::filesystem::rename(staged, path);

  for (int i = 0; i < 400 && channel->version() == 1; ++i) {
    std::this_thread::sleep_for(5ms);
  }
  watcher.stop();
  EXPECT_EQ(channel->current()->request->path, "/renamed");
}
#endif

TEST_F(FileWatcherTest, NoPublishAfterStop) {
  auto channel = std::make_shared<ConfigChannel>(plan_with_workers(2));
  FileWatcher watcher{path, channel, 10ms};
  watcher.start();
  wait_until_watching(watcher);
  watcher.stop();

  write(R"({"request":{"path":"/late"}})");
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(channel->version(), 1u);
}
