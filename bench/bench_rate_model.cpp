#include "load/rate_model.hpp"
#include "scenario/variable_context.hpp"
#include <benchmark/benchmark.h>

using namespace loadcurve;
using namespace std::chrono_literals;

// Evaluated once per worker iteration.
static void BM_CurrentRate_Daily(benchmark::State &state) {
  const LoadModel model = DailyTrafficModel{
      .min = 10, .mid = 200, .max = 800, .cycle_duration = 3600s};
  double t = 0.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(current_rate(model, t, 86400.0));
    t += 0.37;
  }
}

BENCHMARK(BM_CurrentRate_Daily);

static void BM_PacingDelay(benchmark::State &state) {
  double rate = 1.0;
  for (auto _ : state) {
    benchmark::DoNotOptimize(pacing_delay(rate, 64));
    rate = rate > 10'000.0 ? 1.0 : rate * 1.01;
  }
}

BENCHMARK(BM_PacingDelay);

static void BM_Substitute(benchmark::State &state) {
  VariableContext ctx;
  ctx.set("user", "alice");
  ctx.set("token", "eyJhbGciOiJIUzI1NiJ9.payload.sig");
  ctx.set("id", "12345");
  const std::string tmpl =
      R"({"user":"${user}","auth":"Bearer ${token}","item":${id},"x":"${missing}"})";
  for (auto _ : state) {
    benchmark::DoNotOptimize(ctx.substitute(tmpl));
  }
}

BENCHMARK(BM_Substitute);
