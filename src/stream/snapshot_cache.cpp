#include <algorithm>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <dock-dash/core/settings.hpp>
#include <dock-dash/service/container_service.hpp>
#include <dock-dash/stream/snapshot_cache.hpp>

namespace dock_dash {

namespace {

Logger* logger()
{
    return Logger::getInstance("stream");
}

bool isFresh(const Snapshot& snapshot,
             std::optional<std::chrono::milliseconds> max_age,
             std::chrono::steady_clock::time_point now)
{
    return !max_age || now - snapshot.captured_at <= *max_age;
}

} // namespace

SnapshotCache::SnapshotCache(SnapshotSource source, std::chrono::milliseconds interval)
    : source_(std::move(source)),
      interval_(std::max(interval,
                         std::chrono::milliseconds(
                             static_cast<long long>(MIN_REFRESH_INTERVAL_SECONDS * 1000))))
{}

SnapshotCache::SnapshotCache(ContainerService& service, std::chrono::milliseconds interval)
    : SnapshotCache([&service]() { return service.listContainerSummaries(true); }, interval)
{}

SnapshotCache::~SnapshotCache()
{
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.clear();
        if (task_running_) {
            cancelTaskLocked();
        }
        finished = std::move(task_);
    }
    if (finished.joinable()) {
        finished.join();
    }
}

std::shared_ptr<const Snapshot> SnapshotCache::currentSnapshot() const
{
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::vector<ContainerSummary> SnapshotCache::getSnapshot(
    std::optional<std::chrono::milliseconds> max_age)
{
    return ensureSnapshot(max_age)->containers;
}

Payload SnapshotCache::getPayload(std::optional<std::chrono::milliseconds> max_age)
{
    return ensureSnapshot(max_age)->payload;
}

std::shared_ptr<const Snapshot>
SnapshotCache::ensureSnapshot(std::optional<std::chrono::milliseconds> max_age)
{
    const auto requested_at = std::chrono::steady_clock::now();

    auto current = currentSnapshot();
    if (current && isFresh(*current, max_age, requested_at)) {
        return current;
    }

    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    // A refresh that completed while this caller waited for the lock serves it too
    current = currentSnapshot();
    if (current
        && (current->captured_at >= requested_at
            || isFresh(*current, max_age, std::chrono::steady_clock::now()))) {
        return current;
    }
    return refreshLocked();
}

std::shared_ptr<const Snapshot> SnapshotCache::refresh()
{
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);
    return refreshLocked();
}

std::shared_ptr<const Snapshot> SnapshotCache::refreshLocked()
{
    auto containers = source_();
    auto payload = std::make_shared<const std::string>(serializeContainersMessage(containers));

    auto snapshot = std::make_shared<const Snapshot>(
        Snapshot{std::chrono::steady_clock::now(), std::move(payload), std::move(containers)});
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = snapshot;
    }

    const auto count = ++refresh_count_;
    logger()->debug("Snapshot refresh #{} captured {} containers", count,
                    snapshot->containers.size());
    return snapshot;
}

void SnapshotCache::registerSubscriber(const SubscriberPtr& subscriber)
{
    if (!subscriber) {
        return;
    }

    // A new viewer gets the current state right away
    try {
        auto payload = getPayload();
        subscriber->send(*payload);
    }
    catch (const ContainerError& e) {
        logger()->warning("No initial snapshot for {}: {}", subscriber->describe(), e.what());
    }
    catch (const std::exception& e) {
        logger()->debug("Initial send to {} failed: {}", subscriber->describe(), e.what());
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    if (std::find(clients_.begin(), clients_.end(), subscriber) != clients_.end()) {
        return;
    }
    clients_.push_back(subscriber);
    logger()->info("Subscriber {} joined ({} active)", subscriber->describe(), clients_.size());

    if (!task_running_) {
        startTaskLocked();
    }
}

void SnapshotCache::unregisterSubscriber(const SubscriberPtr& subscriber)
{
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = std::find(clients_.begin(), clients_.end(), subscriber);
        if (it == clients_.end()) {
            return;
        }
        clients_.erase(it);
        logger()->info("Subscriber {} left ({} active)", subscriber->describe(), clients_.size());

        if (clients_.empty() && task_running_) {
            cancelTaskLocked();
            // From the broadcast thread itself the handle stays for the next start to join
            if (task_.get_id() != std::this_thread::get_id()) {
                finished = std::move(task_);
            }
        }
    }
    if (finished.joinable()) {
        finished.join();
    }
}

void SnapshotCache::poke()
{
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        force_refresh_ = true;
    }
    signal_cv_.notify_all();
}

bool SnapshotCache::isBroadcasting() const
{
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return task_running_;
}

size_t SnapshotCache::subscriberCount() const
{
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void SnapshotCache::startTaskLocked()
{
    // A thread that stopped on its own has already released every lock
    if (task_.joinable()) {
        task_.join();
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        generation = ++generation_;
    }
    task_ = std::thread(&SnapshotCache::run, this, generation);
    task_running_ = true;
    logger()->debug("Broadcast loop {} started", generation);
}

void SnapshotCache::cancelTaskLocked()
{
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        ++generation_;
    }
    task_running_ = false;
    signal_cv_.notify_all();
}

bool SnapshotCache::isCurrentTask(uint64_t generation)
{
    std::lock_guard<std::mutex> lock(signal_mutex_);
    return generation_ == generation;
}

bool SnapshotCache::waitForNextCycle(uint64_t generation)
{
    std::unique_lock<std::mutex> lock(signal_mutex_);
    signal_cv_.wait_for(lock, interval_,
                        [&]() { return force_refresh_ || generation_ != generation; });
    if (generation_ != generation) {
        return false;
    }
    force_refresh_ = false;
    return true;
}

void SnapshotCache::broadcast(uint64_t generation, const Payload& payload)
{
    std::vector<SubscriberPtr> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients = clients_;
    }

    std::vector<SubscriberPtr> stale;
    for (const auto& client : clients) {
        try {
            client->send(*payload);
        }
        catch (const std::exception& e) {
            logger()->info("Dropping subscriber {}: {}", client->describe(), e.what());
            stale.push_back(client);
        }
    }

    if (stale.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (const auto& client : stale) {
        clients_.erase(std::remove(clients_.begin(), clients_.end(), client), clients_.end());
    }
    if (clients_.empty() && task_running_ && isCurrentTask(generation)) {
        // Nobody is left to listen; the handle is joined by the next start
        cancelTaskLocked();
    }
}

void SnapshotCache::run(uint64_t generation)
{
    while (waitForNextCycle(generation)) {
        Payload payload;
        try {
            payload = refresh()->payload;
        }
        catch (const std::exception& e) {
            logger()->error("Snapshot refresh failed: {}", e.what());
            continue;
        }

        if (!isCurrentTask(generation)) {
            break;
        }
        broadcast(generation, payload);
    }
    logger()->debug("Broadcast loop {} stopped", generation);
}

} // namespace dock_dash
