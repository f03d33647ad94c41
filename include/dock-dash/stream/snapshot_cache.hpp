#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <dock-dash/service/container_summary.hpp>
#include <dock-dash/stream/subscriber.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace dock_dash {

class ContainerService;

using SnapshotSource = std::function<std::vector<ContainerSummary>()>;
using Payload = std::shared_ptr<const std::string>;

/**
 * @brief One consistent view of all containers
 *
 * Immutable once published; readers share it through a shared_ptr.
 */
struct Snapshot {
    std::chrono::steady_clock::time_point captured_at;
    Payload payload;
    std::vector<ContainerSummary> containers;
};

/**
 * @brief Shared, rate-limited container snapshot with push delivery
 *
 * Pull callers read the cached snapshot through getSnapshot()/getPayload(); a
 * snapshot older than the requested max age is refreshed first. Refreshes are
 * single-flight: callers that arrive while one is running wait for it and share
 * its result instead of starting their own.
 *
 * Push callers register a Subscriber. While at least one is registered a
 * background thread refreshes every interval (or right after poke()) and sends
 * the serialized payload to every subscriber, dropping those whose send fails.
 * The thread is started by the first registration and stopped when the set
 * becomes empty.
 *
 * Lock order: clients_mutex_ before signal_mutex_. The snapshot, subscriber and
 * signal locks are never held across a refresh or a send.
 */
class SnapshotCache {
public:
    SnapshotCache(SnapshotSource source, std::chrono::milliseconds interval);
    SnapshotCache(ContainerService& service, std::chrono::milliseconds interval);
    ~SnapshotCache();

    SnapshotCache(const SnapshotCache&) = delete;
    SnapshotCache& operator=(const SnapshotCache&) = delete;

    // Deep copy of the cached container list; no max age accepts any cached snapshot
    std::vector<ContainerSummary> getSnapshot(
        std::optional<std::chrono::milliseconds> max_age = std::nullopt);

    Payload getPayload(std::optional<std::chrono::milliseconds> max_age = std::nullopt);

    // Unconditional refresh; the only path that replaces the cached snapshot
    std::shared_ptr<const Snapshot> refresh();

    void registerSubscriber(const SubscriberPtr& subscriber);
    void unregisterSubscriber(const SubscriberPtr& subscriber);

    // Asks the broadcast loop to refresh without waiting for the interval
    void poke();

    bool isBroadcasting() const;
    size_t subscriberCount() const;
    uint64_t refreshCount() const
    {
        return refresh_count_.load();
    }
    std::chrono::milliseconds getInterval() const
    {
        return interval_;
    }

private:
    std::shared_ptr<const Snapshot> currentSnapshot() const;
    std::shared_ptr<const Snapshot> ensureSnapshot(std::optional<std::chrono::milliseconds> max_age);
    std::shared_ptr<const Snapshot> refreshLocked();

    void startTaskLocked();
    void cancelTaskLocked();
    bool isCurrentTask(uint64_t generation);
    bool waitForNextCycle(uint64_t generation);
    void broadcast(uint64_t generation, const Payload& payload);
    void run(uint64_t generation);

    SnapshotSource source_;
    std::chrono::milliseconds interval_;

    // Snapshot state
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
    std::mutex refresh_mutex_;
    std::atomic<uint64_t> refresh_count_{0};

    // Subscribers and the broadcast thread serving them
    mutable std::mutex clients_mutex_;
    std::vector<SubscriberPtr> clients_;
    std::thread task_;
    bool task_running_ = false;

    // Wake-up signal of the broadcast thread
    std::mutex signal_mutex_;
    std::condition_variable signal_cv_;
    bool force_refresh_ = false;
    uint64_t generation_ = 0;
};

} // namespace dock_dash
