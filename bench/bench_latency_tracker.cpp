#include "metrics/latency_tracker.hpp"
#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace loadcurve;

// Single histogram, shared across benchmark threads.
static void BM_LatencyRecord(benchmark::State &state) {
  static LatencyTracker tracker;
  std::mt19937 gen(static_cast<unsigned>(state.thread_index()));
  std::lognormal_distribution<double> dist(9.0, 1.0); // ~8ms median, in us

  for (auto _ : state) {
    tracker.record_us(static_cast<std::uint64_t>(dist(gen)));
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_LatencyRecord)->ThreadRange(1, std::thread::hardware_concurrency());

// Label lookup + record, as workers do for every request.
static void BM_MultiLabelRecord(benchmark::State &state) {
  static MultiLabelLatencyTracker tracker;
  std::vector<std::string> labels;
  for (int i = 0; i < state.range(0); ++i) {
    labels.push_back("GET /endpoint/" + std::to_string(i));
  }

  std::size_t i = 0;
  for (auto _ : state) {
    tracker.record(labels[i++ % labels.size()], 12.5);
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_MultiLabelRecord)->Arg(1)->Arg(16)->Arg(64)->Threads(1)->Threads(4);

static void BM_LatencyStats(benchmark::State &state) {
  LatencyTracker tracker;
  std::mt19937 gen(42);
  std::lognormal_distribution<double> dist(9.0, 1.0);
  for (int i = 0; i < 100'000; ++i) {
    tracker.record_us(static_cast<std::uint64_t>(dist(gen)));
  }

  for (auto _ : state) {
    benchmark::DoNotOptimize(tracker.stats());
  }
}

BENCHMARK(BM_LatencyStats);
