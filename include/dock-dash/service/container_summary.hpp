#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dock_dash {

// Discriminator of the message pushed to streaming subscribers
constexpr const char* CONTAINERS_MESSAGE_TYPE = "containers";

/**
 * @brief One dashboard row
 */
struct ContainerSummary {
    std::string name;
    std::string status;
    std::optional<std::string> link;
    std::optional<double> cpu;    // percent, one decimal
    std::optional<double> mem_mb; // whole MiB

    bool operator==(const ContainerSummary& other) const
    {
        return name == other.name && status == other.status && link == other.link
               && cpu == other.cpu && mem_mb == other.mem_mb;
    }
};

struct ContainerMetrics {
    std::optional<double> cpu;
    std::optional<double> mem_mb;
};

// Empty optionals serialize as null
void to_json(nlohmann::json& j, const ContainerSummary& summary);
void to_json(nlohmann::json& j, const ContainerMetrics& metrics);

// {"type": "containers", "containers": [...]}
std::string serializeContainersMessage(const std::vector<ContainerSummary>& containers);

} // namespace dock_dash
