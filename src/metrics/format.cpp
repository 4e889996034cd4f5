/// @file format.cpp
/// @brief Formatting helpers for the report.

#include "metrics/format.hpp"

#include <iomanip>
#include <sstream>

namespace loadcurve {

auto format_latency_us(double micros) -> std::string {
  std::ostringstream ss;
  ss << std::fixed;
  if (micros < 1000.0) {
    ss << std::setprecision(0) << micros << "us";
  } else if (micros < 1'000'000.0) {
    ss << std::setprecision(2) << micros / 1000.0 << "ms";
  } else {
    ss << std::setprecision(2) << micros / 1'000'000.0 << "s";
  }
  return ss.str();
}

auto format_rate(double rps) -> std::string {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << rps << " req/s";
  return ss.str();
}

auto format_bytes(std::uint64_t bytes) -> std::string {
  static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream ss;
  if (unit == 0) {
    ss << bytes << " B";
  } else {
    ss << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
  }
  return ss.str();
}

auto format_latency_line(const LatencyStats &s) -> std::string {
  std::ostringstream ss;
  ss << "count=" << s.count
     << " p50=" << format_latency_us(static_cast<double>(s.p50_us))
     << " p90=" << format_latency_us(static_cast<double>(s.p90_us))
     << " p95=" << format_latency_us(static_cast<double>(s.p95_us))
     << " p99=" << format_latency_us(static_cast<double>(s.p99_us))
     << " p99.9=" << format_latency_us(static_cast<double>(s.p99_9_us))
     << " max=" << format_latency_us(static_cast<double>(s.max_us));
  return ss.str();
}

auto format_throughput_line(const ThroughputStats &s) -> std::string {
  std::ostringstream ss;
  ss << "count=" << s.total_count << " rps=" << std::fixed
     << std::setprecision(1) << s.rps << " avg=" << std::setprecision(2)
     << s.avg_time_ms << "ms";
  return ss.str();
}

} // namespace loadcurve
