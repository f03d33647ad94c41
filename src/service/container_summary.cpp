#include <dock-dash/service/container_summary.hpp>

namespace dock_dash {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json& j, const ContainerSummary& summary)
{
    j = nlohmann::json{{"name", summary.name},
                       {"status", summary.status},
                       {"link", optionalToJson(summary.link)},
                       {"cpu", optionalToJson(summary.cpu)},
                       {"mem_mb", optionalToJson(summary.mem_mb)}};
}

void to_json(nlohmann::json& j, const ContainerMetrics& metrics)
{
    j = nlohmann::json{{"cpu", optionalToJson(metrics.cpu)},
                       {"mem_mb", optionalToJson(metrics.mem_mb)}};
}

std::string serializeContainersMessage(const std::vector<ContainerSummary>& containers)
{
    nlohmann::json message = {{"type", CONTAINERS_MESSAGE_TYPE}, {"containers", containers}};

    // Container names and statuses can carry non-UTF-8 bytes; replace instead of throwing
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace dock_dash
