#pragma once

#include <dock-dash/runtime/runtime_client.hpp>
#include <optional>

namespace dock_dash {

constexpr double BYTES_PER_MEGABYTE = 1024.0 * 1024.0;

// CPU utilisation between the two samples of a stats reading, in percent of one CPU.
// Empty unless both the container and the system counters advanced.
std::optional<double> cpuPercent(const RawStats& stats);

// Memory usage in MiB, empty when the usage counter was malformed
std::optional<double> memMb(const RawStats& stats);

// Half-away-from-zero rounding to a number of decimals
double roundTo(double value, int decimals);

} // namespace dock_dash
