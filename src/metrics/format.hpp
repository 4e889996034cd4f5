#pragma once
/// @file format.hpp
/// @brief Human-readable rendering of latencies, rates and byte sizes.

#include "metrics/latency_tracker.hpp"
#include "metrics/throughput_tracker.hpp"

#include <cstdint>
#include <string>

namespace loadcurve {

/// @brief "850us", "12.34ms", "1.50s".
[[nodiscard]] auto format_latency_us(double micros) -> std::string;

/// @brief "1234.5 req/s".
[[nodiscard]] auto format_rate(double rps) -> std::string;

/// @brief "512 B", "1.5 KiB", "3.2 GiB".
[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

/// @brief `count=… p50=… p90=… p95=… p99=… p99.9=… max=…` on one line.
[[nodiscard]] auto format_latency_line(const LatencyStats &s) -> std::string;

/// @brief `count=… rps=… avg=…` on one line.
[[nodiscard]] auto format_throughput_line(const ThroughputStats &s)
    -> std::string;

} // namespace loadcurve
