#pragma once

#include <dock-dash/cache/stats_cache.hpp>
#include <dock-dash/core/settings.hpp>
#include <dock-dash/runtime/runtime_client.hpp>
#include <dock-dash/service/container_summary.hpp>
#include <map>
#include <string>
#include <vector>

namespace dock_dash {

struct ExecCommand {
    ExecProfile profile;
    std::string command;
};

/**
 * @brief Read-side queries behind the dashboard views
 *
 * Metrics are best effort everywhere: a container whose stats cannot be read is
 * still listed, with empty cpu and mem_mb.
 */
class ContainerService {
public:
    ContainerService(RuntimeClient& client, StatsCache& stats, DashboardSettings settings);

    ContainerService(const ContainerService&) = delete;
    ContainerService& operator=(const ContainerService&) = delete;

    // All containers in runtime order; without metrics no stats are read
    std::vector<ContainerSummary> listContainerSummaries(bool include_metrics);

    // Metrics by container name; an empty list means every container, unknown names are skipped
    std::map<std::string, ContainerMetrics> getContainersMetrics(
        const std::vector<std::string>& names);

    // Throws CONTAINER_NOT_FOUND; a failed fetch becomes "[error] <reason>"
    std::string getContainerLogs(const std::string& name, int tail);

    // Throws CONTAINER_NOT_FOUND
    std::string getContainerInspect(const std::string& name);

    std::vector<ExecCommand> buildExecCommands(const std::string& name) const;

    std::optional<std::string> buildLink(const std::optional<std::string>& host_port) const;

    int clampTail(int tail) const;

    const DashboardSettings& getSettings() const
    {
        return settings_;
    }

private:
    ContainerMetrics metricsFor(const std::optional<RawStats>& raw) const;

    RuntimeClient& client_;
    StatsCache& stats_;
    DashboardSettings settings_;
};

} // namespace dock_dash
