#pragma once

#include <chrono>
#include <dock-dash/runtime/runtime_client.hpp>
#include <string>

namespace dock_dash {

/**
 * @brief Executes start/stop/restart requests against the runtime
 *
 * The service knows nothing about the snapshot cache; callers that stream
 * state poke the cache after a successful action.
 */
class ActionService {
public:
    ActionService(RuntimeClient& client, std::chrono::milliseconds settle_delay);

    ActionService(const ActionService&) = delete;
    ActionService& operator=(const ActionService&) = delete;

    /**
     * @brief Run an action on a container by name
     *
     * Throws INVALID_OPERATION for anything but start, stop or restart, before any
     * runtime call, and CONTAINER_NOT_FOUND when the name is unknown. On success the
     * calling thread sleeps once for the settle delay.
     */
    void performAction(const std::string& name, const std::string& action);

    std::chrono::milliseconds getSettleDelay() const
    {
        return settle_delay_;
    }

private:
    RuntimeClient& client_;
    std::chrono::milliseconds settle_delay_;
};

} // namespace dock_dash
