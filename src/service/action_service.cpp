#include <algorithm>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/service/action_service.hpp>
#include <thread>

namespace dock_dash {

ActionService::ActionService(RuntimeClient& client, std::chrono::milliseconds settle_delay)
    : client_(client), settle_delay_(std::max(settle_delay, std::chrono::milliseconds::zero()))
{}

void ActionService::performAction(const std::string& name, const std::string& action)
{
    auto* logger = Logger::getInstance("actions");

    const auto parsed = parseContainerAction(action);
    if (!parsed) {
        logger->warning("Rejected action '{}' for container {}", action, name);
        throw ContainerError(ErrorCode::INVALID_OPERATION, "invalid operation: " + action);
    }

    const auto container = client_.getContainer(name);
    client_.performAction(container, *parsed);
    logger->info("Performed {} on container {}", action, name);

    if (settle_delay_ > std::chrono::milliseconds::zero()) {
        std::this_thread::sleep_for(settle_delay_);
    }
}

} // namespace dock_dash
