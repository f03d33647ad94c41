#include <algorithm>
#include <atomic>
#include <dock-dash/cache/stats_cache.hpp>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/logger.hpp>
#include <future>
#include <unordered_set>

namespace dock_dash {

namespace {

Logger* logger()
{
    return Logger::getInstance("stats");
}

} // namespace

StatsCache::StatsCache(RuntimeClient& client,
                       std::chrono::milliseconds ttl,
                       size_t max_concurrency,
                       SteadyClock clock)
    : client_(client), ttl_(ttl), max_concurrency_(std::max<size_t>(1, max_concurrency)),
      clock_(std::move(clock))
{}

StatsMap StatsCache::getOrFetch(const std::vector<ContainerHandle>& containers)
{
    StatsMap stats_map;
    std::vector<ContainerHandle> to_fetch;

    for (const auto& container : containers) {
        if (!container.isRunning()) {
            stats_map[container.id] = std::nullopt;
            continue;
        }

        if (auto cached = lookup(container.id)) {
            stats_map[container.id] = cached->raw;
        }
        else if (stats_map.find(container.id) == stats_map.end()) {
            stats_map[container.id] = std::nullopt;
            to_fetch.push_back(container);
        }
    }

    if (to_fetch.empty()) {
        return stats_map;
    }

    logger()->debug("Fetching stats for {} containers ({} cached)", to_fetch.size(),
                    containers.size() - to_fetch.size());

    auto results = fetchAll(to_fetch);
    for (size_t i = 0; i < to_fetch.size(); ++i) {
        store(to_fetch[i].id, results[i]);
        stats_map[to_fetch[i].id] = std::move(results[i]);
    }
    return stats_map;
}

std::vector<std::optional<RawStats>>
StatsCache::fetchAll(const std::vector<ContainerHandle>& misses)
{
    std::vector<std::optional<RawStats>> results(misses.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < misses.size(); i = next++) {
            results[i] = fetchOne(misses[i]);
        }
    };

    const size_t worker_count = std::min(max_concurrency_, misses.size());
    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.push_back(std::async(std::launch::async, worker));
    }
    for (auto& w : workers) {
        w.get();
    }
    return results;
}

std::optional<RawStats> StatsCache::fetchOne(const ContainerHandle& handle)
{
    // Stats are best effort: a failure degrades to a missing sample
    try {
        return client_.fetchStats(handle);
    }
    catch (const ContainerError& e) {
        if (e.getErrorCode() == ErrorCode::STATS_UNAVAILABLE) {
            logger()->debug("Stats for {} unavailable: {}", handle.name, e.getMessage());
        }
        else {
            logger()->warning("Stats fetch for {} failed: {}", handle.name, e.what());
        }
    }
    catch (const std::exception& e) {
        logger()->warning("Stats fetch for {} failed: {}", handle.name, e.what());
    }
    return std::nullopt;
}

std::optional<StatsCache::Entry> StatsCache::lookup(const std::string& container_id)
{
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(container_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now - it->second.captured_at <= ttl_) {
        return it->second;
    }
    entries_.erase(it);
    return std::nullopt;
}

void StatsCache::store(const std::string& container_id, const std::optional<RawStats>& raw)
{
    const auto now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[container_id] = Entry{now, raw};
}

size_t StatsCache::pruneAbsent(const std::vector<ContainerHandle>& present)
{
    std::unordered_set<std::string> ids;
    for (const auto& container : present) {
        ids.insert(container.id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (ids.count(it->first) == 0) {
            it = entries_.erase(it);
            ++removed;
        }
        else {
            ++it;
        }
    }
    return removed;
}

size_t StatsCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void StatsCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace dock_dash
