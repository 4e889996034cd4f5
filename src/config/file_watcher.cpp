/// @file file_watcher.cpp
/// @brief FileWatcher implementation.

#include "config/file_watcher.hpp"
#include "config/plan_loader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>
#include <system_error>

#ifdef __linux__
#include <sys/inotify.h>
#endif

namespace loadcurve {

FileWatcher::FileWatcher(std::filesystem::path path,
                         std::shared_ptr<ConfigChannel> channel,
                         std::chrono::milliseconds interval)
    : path_{std::move(path)}, channel_{std::move(channel)},
      interval_{interval} {
  std::error_code ec;
  last_write_ = std::filesystem::last_write_time(path_, ec);
}

FileWatcher::~FileWatcher() { stop(); }

void FileWatcher::start() {
  if (thread_.joinable()) {
    return;
  }
  net::co_spawn(ioc_, watch_events(), [](std::exception_ptr ep) {
    if (!ep) {
      return;
    }
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception &e) {
      std::cerr << "[Config] Watcher stopped: " << e.what() << "\n";
    }
  });
  thread_ = std::thread([this] { ioc_.run(); });
  std::cout << "[Config] Watching " << path_.string() << " for changes\n";
}

void FileWatcher::stop() {
  ioc_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

auto FileWatcher::watch_events() -> net::awaitable<void> {
#ifdef __linux__
  const int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd < 0) {
    std::cerr << "[Config] inotify unavailable (" << std::strerror(errno)
              << "), checking every " << interval_.count() << "ms\n";
    co_await watch_interval();
    co_return;
  }
  net::posix::stream_descriptor events{ioc_, fd};

  // Watch the directory so editors that replace the file are still seen.
  auto dir = path_.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  if (::inotify_add_watch(fd, dir.c_str(),
                          IN_CLOSE_WRITE | IN_MOVED_TO | IN_ATTRIB) < 0) {
    std::cerr << "[Config] Cannot watch " << dir.string() << " ("
              << std::strerror(errno) << "), checking every "
              << interval_.count() << "ms\n";
    co_await watch_interval();
    co_return;
  }
  event_driven_.store(true, std::memory_order_release);

  const auto name = path_.filename().string();
  alignas(inotify_event) std::array<char, 4096> buf{};
  for (;;) {
    boost::system::error_code ec;
    const auto n = co_await events.async_read_some(
        net::buffer(buf), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      co_return;
    }

    // Parsed in a plain lambda: inotify_event (flexible array member) may
    // not live in a coroutine frame.
    const bool touched = [&] {
      bool touched = false;
      for (std::size_t off = 0; off + sizeof(inotify_event) <= n;) {
        inotify_event ev;
        std::memcpy(&ev, buf.data() + off, sizeof(ev));
        const char *ev_name = buf.data() + off + sizeof(inotify_event);
        if (ev.len > 0 && name == ev_name) {
          touched = true;
        }
        off += sizeof(inotify_event) + ev.len;
      }
      return touched;
    }();
    if (touched) {
      poll();
    }
  }
#else
  co_await watch_interval();
#endif
}

auto FileWatcher::watch_interval() -> net::awaitable<void> {
  net::steady_timer timer{ioc_};
  for (;;) {
    timer.expires_after(interval_);
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec) {
      co_return;
    }
    poll();
  }
}

auto FileWatcher::poll() -> bool {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path_, ec);
  if (ec || mtime == last_write_) {
    return false;
  }
  last_write_ = mtime;

  auto loaded = load_plan_file(path_);
  if (!loaded) {
    std::cerr << "[Config] Reload of " << path_.string()
              << " rejected: " << describe(loaded.error()) << "\n";
    return false;
  }
  for (const auto &w : loaded->warnings) {
    std::cerr << "[Config] Warning: " << w << "\n";
  }

  auto plan = std::make_shared<const RunPlan>(std::move(loaded->plan));
  std::cout << "[Config] Reloaded plan: " << describe(plan->load) << "\n";
  channel_->publish(std::move(plan));
  ++reloads_;
  return true;
}

} // namespace loadcurve
