#pragma once
/// @file file_watcher.hpp
/// @brief Republishes the plan on a ConfigChannel when its file changes.

#include "engine/config_channel.hpp"
#include "http/asio.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>

namespace loadcurve {

/// @brief Watches the plan file from a background io_context.
///
/// On Linux the directory holding the file is watched with inotify, so a
/// write, an atomic rename over the file or an mtime change triggers a check
/// at once. Elsewhere, or if inotify cannot be set up, the mtime is checked
/// every @p interval. A changed file is reloaded; a valid plan is published,
/// an invalid one is logged and the running plan is kept. Worker count and
/// duration changes do not affect a run already in progress.
class FileWatcher {
public:
  FileWatcher(std::filesystem::path path,
              std::shared_ptr<ConfigChannel> channel,
              std::chrono::milliseconds interval = std::chrono::seconds{1});
  ~FileWatcher();

  FileWatcher(const FileWatcher &) = delete;
  FileWatcher &operator=(const FileWatcher &) = delete;

  void start();

  /// @brief Stop watching and join the thread. No publish happens after
  ///        this returns.
  void stop();

  /// @brief Check once; returns true if a new plan was published.
  auto poll() -> bool;

  [[nodiscard]] auto reloads() const noexcept -> std::uint64_t {
    return reloads_.load(std::memory_order_relaxed);
  }

  /// @brief True once start() has set up event-driven watching.
  [[nodiscard]] auto event_driven() const noexcept -> bool {
    return event_driven_.load(std::memory_order_acquire);
  }

private:
  auto watch_events() -> net::awaitable<void>;
  auto watch_interval() -> net::awaitable<void>;

  std::filesystem::path path_;
  std::shared_ptr<ConfigChannel> channel_;
  std::chrono::milliseconds interval_;
  std::filesystem::file_time_type last_write_{};

  net::io_context ioc_{1};
  std::thread thread_;
  std::atomic<bool> event_driven_{false};
  std::atomic<std::uint64_t> reloads_{0};
};

} // namespace loadcurve
