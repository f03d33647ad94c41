#pragma once

#include <chrono>
#include <dock-dash/core/settings.hpp>
#include <dock-dash/runtime/runtime_client.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dock_dash {

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

using StatsMap = std::unordered_map<std::string, std::optional<RawStats>>;

/**
 * @brief Short-lived per-container cache of raw stats samples
 *
 * Entries are keyed by container id and reused while younger than the TTL.
 * Misses are fetched in parallel by at most max_concurrency workers; a failed
 * fetch is cached as an empty sample instead of being reported. The map lock
 * is only held for lookups and inserts, never across a runtime call.
 */
class StatsCache {
public:
    explicit StatsCache(RuntimeClient& client,
                        std::chrono::milliseconds ttl = STATS_CACHE_TTL,
                        size_t max_concurrency = MAX_CONCURRENT_STATS_FETCHES,
                        SteadyClock clock = [] { return std::chrono::steady_clock::now(); });

    StatsCache(const StatsCache&) = delete;
    StatsCache& operator=(const StatsCache&) = delete;

    /**
     * @brief Stats for each handle, keyed by container id
     *
     * Containers that are not running map to an empty sample without a runtime call.
     */
    StatsMap getOrFetch(const std::vector<ContainerHandle>& containers);

    // Drops entries for containers missing from the given list, returns how many went
    size_t pruneAbsent(const std::vector<ContainerHandle>& present);

    size_t size() const;
    void clear();

private:
    struct Entry {
        std::chrono::steady_clock::time_point captured_at;
        std::optional<RawStats> raw;
    };

    std::optional<Entry> lookup(const std::string& container_id);
    void store(const std::string& container_id, const std::optional<RawStats>& raw);
    std::vector<std::optional<RawStats>> fetchAll(const std::vector<ContainerHandle>& misses);
    std::optional<RawStats> fetchOne(const ContainerHandle& handle);

    RuntimeClient& client_;
    std::chrono::milliseconds ttl_;
    size_t max_concurrency_;
    SteadyClock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace dock_dash
