#pragma once

#include <memory>
#include <string>

namespace dock_dash {

/**
 * @brief Destination of snapshot broadcasts, one per live streaming connection
 *
 * send() throws when the connection is gone; the snapshot cache then drops the
 * subscriber. Implementations must not call back into the cache from send().
 */
class Subscriber {
public:
    virtual ~Subscriber() = default;

    virtual void send(const std::string& payload) = 0;

    // Short label for log lines
    virtual std::string describe() const
    {
        return "subscriber";
    }
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

} // namespace dock_dash
