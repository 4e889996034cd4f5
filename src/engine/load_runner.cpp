/// @file load_runner.cpp
/// @brief LoadRunner implementation.

#include "engine/load_runner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>

namespace loadcurve {

LoadRunner::LoadRunner(std::shared_ptr<ConfigChannel> channel,
                       std::shared_ptr<EngineContext> engine,
                       std::shared_ptr<HttpClient> client,
                       std::unique_ptr<MemoryLimitProvider> memory,
                       std::size_t threads)
    : channel_{std::move(channel)}, engine_{std::move(engine)},
      client_{std::move(client)}, memory_{std::move(memory)},
      threads_{threads > 0
                   ? threads
                   : std::max<std::size_t>(std::thread::hardware_concurrency(),
                                           1)},
      ioc_{static_cast<int>(threads_)} {}

LoadRunner::~LoadRunner() {
  if (subscription_) {
    channel_->unsubscribe(*subscription_);
  }
}

auto LoadRunner::run() -> RunSummary {
  const auto plan = channel_->current();
  const auto start = Clock::now();
  const auto deadline =
      start + std::chrono::duration_cast<Clock::duration>(plan->duration);

  engine_->set_initial_tracking(plan->percentiles);
  engine_->throughput().reset();

  std::cout << "[Runner] " << plan->workers << " workers on " << threads_
            << " threads for " << plan->duration.count() << "s, "
            << describe(plan->load) << "\n";

  RunSummary summary;
  summary.workers = plan->workers;
  std::atomic<std::uint64_t> iterations{0};
  std::atomic<std::uint64_t> failures{0};

  workers_.reserve(plan->workers);
  for (std::size_t i = 0; i < plan->workers; ++i) {
    workers_.push_back(std::make_unique<Worker>(
        WorkerConfig{.id = i,
                     .worker_count = plan->workers,
                     .start = start,
                     .deadline = deadline},
        net::make_strand(ioc_), engine_, channel_, client_));
  }

  subscription_ = channel_->subscribe(
      [this](const ConfigChannel::PlanPtr &, std::uint64_t) {
        plan_updates_.fetch_add(1, std::memory_order_relaxed);
        for (auto &w : workers_) {
          w->wake();
        }
      });

  for (auto &w : workers_) {
    net::co_spawn(
        w->executor(), w->run(),
        [&iterations, &failures](
            std::exception_ptr ep, WorkerStats stats) {
          if (ep) {
            try {
              std::rethrow_exception(ep);
            } catch (const std::exception &e) {
              std::cerr << "[Runner] Worker stopped: " << e.what() << "\n";
            }
            return;
          }
          iterations.fetch_add(stats.iterations, std::memory_order_relaxed);
          failures.fetch_add(stats.failures, std::memory_order_relaxed);
        });
  }

  guard_ = std::make_unique<MemoryGuard>(plan->guard, engine_,
                                         std::move(memory_));
  net::co_spawn(net::make_strand(ioc_), guard_->run(deadline),
                [](std::exception_ptr ep) {
                  if (!ep) {
                    return;
                  }
                  try {
                    std::rethrow_exception(ep);
                  } catch (const std::exception &e) {
                    std::cerr << "[MemoryGuard] Stopped: " << e.what() << "\n";
                  }
                });

  std::vector<std::thread> pool;
  pool.reserve(threads_ - 1);
  for (std::size_t i = 1; i < threads_; ++i) {
    pool.emplace_back([this] { ioc_.run(); });
  }
  ioc_.run();
  for (auto &t : pool) {
    t.join();
  }

  channel_->unsubscribe(*subscription_);
  subscription_.reset();
  client_->close_idle();

  summary.elapsed = Clock::now() - start;
  summary.iterations = iterations.load();
  summary.failures = failures.load();
  summary.guard = guard_->state();
  summary.plan_updates = plan_updates_.load();
  return summary;
}

} // namespace loadcurve
