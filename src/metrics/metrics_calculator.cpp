#include <cmath>
#include <dock-dash/metrics/metrics_calculator.hpp>

namespace dock_dash {

namespace {

// Counters are monotonic; a reset between samples shows up as a negative delta
double counterDelta(const std::optional<uint64_t>& now, const std::optional<uint64_t>& prev)
{
    const uint64_t current = now.value_or(0);
    const uint64_t previous = prev.value_or(0);
    return static_cast<double>(static_cast<int64_t>(current - previous));
}

double onlineCpus(const CpuCounters& cpu)
{
    if (cpu.online_cpus) {
        return static_cast<double>(*cpu.online_cpus);
    }
    if (cpu.percpu_count > 0) {
        return static_cast<double>(cpu.percpu_count);
    }
    return 1.0;
}

} // namespace

std::optional<double> cpuPercent(const RawStats& stats)
{
    const double cpu_delta = counterDelta(stats.cpu.total_usage, stats.precpu.total_usage);
    const double sys_delta = counterDelta(stats.cpu.system_usage, stats.precpu.system_usage);
    const double cpus = onlineCpus(stats.cpu);

    if (cpu_delta > 0.0 && sys_delta > 0.0 && cpus > 0.0) {
        return (cpu_delta / sys_delta) * cpus * 100.0;
    }
    return std::nullopt;
}

std::optional<double> memMb(const RawStats& stats)
{
    if (!stats.memory_usage) {
        return std::nullopt;
    }
    return static_cast<double>(*stats.memory_usage) / BYTES_PER_MEGABYTE;
}

double roundTo(double value, int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace dock_dash
