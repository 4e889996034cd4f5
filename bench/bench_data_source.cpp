#include "data/data_source.hpp"
#include <benchmark/benchmark.h>
#include <string>
#include <thread>

using namespace loadcurve;

namespace {

auto make_csv(int rows) -> std::string {
  std::string csv = "user,password,region\n";
  for (int i = 0; i < rows; ++i) {
    csv += "user" + std::to_string(i) + ",pw" + std::to_string(i) + ",eu\n";
  }
  return csv;
}

} // namespace

// Contention on the shared cursor.
static void BM_NextRow(benchmark::State &state) {
  static const auto source = DataSource::from_string(make_csv(1000)).value();
  for (auto _ : state) {
    benchmark::DoNotOptimize(&source.next_row());
  }
  state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_NextRow)->ThreadRange(1, std::thread::hardware_concurrency());

static void BM_ParseCsv(benchmark::State &state) {
  const auto csv = make_csv(static_cast<int>(state.range(0)));
  for (auto _ : state) {
    benchmark::DoNotOptimize(DataSource::from_string(csv));
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<std::int64_t>(csv.size()));
}

BENCHMARK(BM_ParseCsv)->Arg(100)->Arg(10'000);
