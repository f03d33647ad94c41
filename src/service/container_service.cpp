#include <algorithm>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/metrics/metrics_calculator.hpp>
#include <dock-dash/service/container_service.hpp>
#include <unordered_set>

namespace dock_dash {

namespace {

constexpr int CPU_DECIMALS = 1;
constexpr int MEM_DECIMALS = 0;

Logger* logger()
{
    return Logger::getInstance("runtime");
}

} // namespace

ContainerService::ContainerService(RuntimeClient& client,
                                   StatsCache& stats,
                                   DashboardSettings settings)
    : client_(client), stats_(stats), settings_(std::move(settings))
{}

std::vector<ContainerSummary> ContainerService::listContainerSummaries(bool include_metrics)
{
    const auto containers = client_.listContainers(true);

    StatsMap stats_map;
    if (include_metrics) {
        stats_.pruneAbsent(containers);
        stats_map = stats_.getOrFetch(containers);
    }

    std::vector<ContainerSummary> result;
    result.reserve(containers.size());
    for (const auto& container : containers) {
        ContainerSummary summary;
        summary.name = container.name;
        summary.status = container.status;
        summary.link = buildLink(container.host_port);

        if (include_metrics) {
            auto it = stats_map.find(container.id);
            if (it != stats_map.end()) {
                auto metrics = metricsFor(it->second);
                summary.cpu = metrics.cpu;
                summary.mem_mb = metrics.mem_mb;
            }
        }
        result.push_back(std::move(summary));
    }
    return result;
}

std::map<std::string, ContainerMetrics>
ContainerService::getContainersMetrics(const std::vector<std::string>& names)
{
    const std::unordered_set<std::string> wanted(names.begin(), names.end());

    std::vector<ContainerHandle> selected;
    for (auto& container : client_.listContainers(true)) {
        if (wanted.empty() || wanted.count(container.name) > 0) {
            selected.push_back(std::move(container));
        }
    }

    const auto stats_map = stats_.getOrFetch(selected);

    std::map<std::string, ContainerMetrics> metrics;
    for (const auto& container : selected) {
        auto it = stats_map.find(container.id);
        metrics[container.name] =
            it != stats_map.end() ? metricsFor(it->second) : ContainerMetrics{};
    }
    return metrics;
}

ContainerMetrics ContainerService::metricsFor(const std::optional<RawStats>& raw) const
{
    ContainerMetrics metrics;
    if (!raw) {
        return metrics;
    }
    if (auto cpu = cpuPercent(*raw)) {
        metrics.cpu = roundTo(*cpu, CPU_DECIMALS);
    }
    if (auto mem = memMb(*raw)) {
        metrics.mem_mb = roundTo(*mem, MEM_DECIMALS);
    }
    return metrics;
}

int ContainerService::clampTail(int tail) const
{
    return std::max(1, std::min(tail, settings_.log_max_tail));
}

std::string ContainerService::getContainerLogs(const std::string& name, int tail)
{
    const auto container = client_.getContainer(name);
    try {
        return client_.fetchLogs(container, clampTail(tail));
    }
    catch (const ContainerError& e) {
        if (e.getErrorCode() == ErrorCode::CONTAINER_NOT_FOUND) {
            throw;
        }
        logger()->warning("Logs unavailable for {}: {}", name, e.what());
        return "[error] " + e.getMessage();
    }
    catch (const std::exception& e) {
        logger()->warning("Logs unavailable for {}: {}", name, e.what());
        return std::string("[error] ") + e.what();
    }
}

std::string ContainerService::getContainerInspect(const std::string& name)
{
    return client_.inspect(client_.getContainer(name));
}

std::vector<ExecCommand> ContainerService::buildExecCommands(const std::string& name) const
{
    std::vector<ExecCommand> commands;
    for (auto profile : settings_.exec_profiles) {
        switch (profile) {
            case ExecProfile::WSL:
                commands.push_back({profile, "wsl -d " + settings_.wsl_distro + " docker exec -it "
                                                 + name + " " + settings_.exec_shell});
                break;
            case ExecProfile::DOCKER:
                commands.push_back(
                    {profile, "docker exec -it " + name + " " + settings_.exec_shell});
                break;
        }
    }
    return commands;
}

std::optional<std::string>
ContainerService::buildLink(const std::optional<std::string>& host_port) const
{
    if (!host_port || host_port->empty()) {
        return std::nullopt;
    }
    return settings_.link_scheme + "://" + settings_.link_host + ":" + *host_port;
}

} // namespace dock_dash
