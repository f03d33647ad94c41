#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dock_dash {

/**
 * @brief Identity and state of one container as reported by the runtime
 */
struct ContainerHandle {
    std::string id;
    std::string name;
    std::string status;                   // raw runtime state: running, exited, paused...
    std::optional<std::string> host_port; // first published host port

    bool isRunning() const
    {
        return status == "running";
    }
};

/**
 * @brief CPU counters of one stats sample
 *
 * Fields the runtime did not report, or reported in a malformed shape, stay empty.
 */
struct CpuCounters {
    std::optional<uint64_t> total_usage;
    std::optional<uint64_t> system_usage;
    std::optional<uint32_t> online_cpus;
    size_t percpu_count = 0;
};

/**
 * @brief Raw resource counters for one container at one instant
 */
struct RawStats {
    CpuCounters cpu;
    CpuCounters precpu;
    std::optional<uint64_t> memory_usage;
};

enum class ContainerAction { START, STOP, RESTART };

std::string containerActionToString(ContainerAction action);
std::optional<ContainerAction> parseContainerAction(const std::string& text);

/**
 * @brief Calls into the container runtime daemon
 *
 * Implementations must be safe to call from several threads at once.
 * Lookups by name throw ContainerError(CONTAINER_NOT_FOUND) on a miss.
 * fetchStats throws ContainerError(STATS_UNAVAILABLE) when the sample cannot be read
 * and returns std::nullopt when the daemon has no sample for the container.
 */
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    virtual std::vector<ContainerHandle> listContainers(bool all) = 0;
    virtual ContainerHandle getContainer(const std::string& name) = 0;
    virtual std::optional<RawStats> fetchStats(const ContainerHandle& handle) = 0;
    virtual void performAction(const ContainerHandle& handle, ContainerAction action) = 0;
    virtual std::string fetchLogs(const ContainerHandle& handle, int tail) = 0;

    // Raw inspect document as JSON text
    virtual std::string inspect(const ContainerHandle& handle) = 0;
};

} // namespace dock_dash
