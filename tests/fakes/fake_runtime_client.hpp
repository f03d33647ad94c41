#pragma once

#include <atomic>
#include <chrono>
#include <dock-dash/core/error.hpp>
#include <dock-dash/runtime/runtime_client.hpp>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace dock_dash {
namespace testing {

inline ContainerHandle makeHandle(const std::string& name,
                                  const std::string& status = "running",
                                  std::optional<std::string> host_port = std::nullopt)
{
    ContainerHandle handle;
    handle.id = "id-" + name;
    handle.name = name;
    handle.status = status;
    handle.host_port = std::move(host_port);
    return handle;
}

// Half a CPU on a single-CPU host, 100 MiB of memory
inline RawStats makeStats(uint64_t cpu_delta = 500000000,
                          uint64_t sys_delta = 1000000000,
                          uint64_t memory = 104857600)
{
    RawStats stats;
    stats.precpu.total_usage = 1000;
    stats.precpu.system_usage = 2000;
    stats.cpu.total_usage = 1000 + cpu_delta;
    stats.cpu.system_usage = 2000 + sys_delta;
    stats.cpu.online_cpus = 1;
    stats.memory_usage = memory;
    return stats;
}

/**
 * In-memory RuntimeClient that records every call.
 */
class FakeRuntimeClient : public RuntimeClient {
public:
    void addContainer(const ContainerHandle& handle, std::optional<RawStats> stats = makeStats())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        containers_.push_back(handle);
        stats_[handle.id] = stats;
    }

    void removeContainer(const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = containers_.begin(); it != containers_.end(); ++it) {
            if (it->name == name) {
                containers_.erase(it);
                return;
            }
        }
    }

    void setStatus(const std::string& name, const std::string& status)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& c : containers_) {
            if (c.name == name) {
                c.status = status;
            }
        }
    }

    void setStatsThrows(bool throws)
    {
        stats_throw_ = throws;
    }

    void setStatsDelay(std::chrono::milliseconds delay)
    {
        stats_delay_ = delay;
    }

    void setListDelay(std::chrono::milliseconds delay)
    {
        list_delay_ = delay;
    }

    void setListThrows(bool throws)
    {
        list_throws_ = throws;
    }

    void setLogs(const std::string& logs)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_ = logs;
    }

    void setLogsThrow(bool throws)
    {
        logs_throw_ = throws;
    }

    std::vector<ContainerHandle> listContainers(bool all) override
    {
        ++list_calls;
        if (list_delay_.count() > 0) {
            std::this_thread::sleep_for(list_delay_);
        }
        if (list_throws_) {
            throw ContainerError(ErrorCode::RUNTIME_UNAVAILABLE, "daemon down");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (all) {
            return containers_;
        }
        std::vector<ContainerHandle> running;
        for (const auto& c : containers_) {
            if (c.isRunning()) {
                running.push_back(c);
            }
        }
        return running;
    }

    ContainerHandle getContainer(const std::string& name) override
    {
        ++get_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& c : containers_) {
            if (c.name == name) {
                return c;
            }
        }
        throw ContainerError(ErrorCode::CONTAINER_NOT_FOUND, name);
    }

    std::optional<RawStats> fetchStats(const ContainerHandle& handle) override
    {
        ++stats_calls;
        const int now_in_flight = ++in_flight_;
        int seen = max_in_flight.load();
        while (now_in_flight > seen && !max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
        }
        if (stats_delay_.count() > 0) {
            std::this_thread::sleep_for(stats_delay_);
        }
        --in_flight_;

        if (stats_throw_) {
            throw ContainerError(ErrorCode::STATS_UNAVAILABLE, handle.name + " stats stream closed");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stats_.find(handle.id);
        return it == stats_.end() ? std::nullopt : it->second;
    }

    void performAction(const ContainerHandle& handle, ContainerAction action) override
    {
        ++action_calls;
        std::lock_guard<std::mutex> lock(mutex_);
        performed.emplace_back(handle.name, action);
    }

    std::string fetchLogs(const ContainerHandle& handle, int tail) override
    {
        ++log_calls;
        last_tail = tail;
        if (logs_throw_) {
            throw ContainerError(ErrorCode::LOGS_UNAVAILABLE, handle.name + " log driver none");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_;
    }

    std::string inspect(const ContainerHandle& handle) override
    {
        return "{\"Id\": \"" + handle.id + "\"}";
    }

    int runtimeCallsExceptLookup() const
    {
        return list_calls + stats_calls + action_calls + log_calls;
    }

    std::atomic<int> list_calls{0};
    std::atomic<int> get_calls{0};
    std::atomic<int> stats_calls{0};
    std::atomic<int> action_calls{0};
    std::atomic<int> log_calls{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<int> last_tail{0};
    std::vector<std::pair<std::string, ContainerAction>> performed;

private:
    std::mutex mutex_;
    std::vector<ContainerHandle> containers_;
    std::map<std::string, std::optional<RawStats>> stats_;
    std::string logs_;
    std::atomic<bool> stats_throw_{false};
    std::atomic<bool> list_throws_{false};
    std::atomic<bool> logs_throw_{false};
    std::atomic<int> in_flight_{0};
    std::chrono::milliseconds stats_delay_{0};
    std::chrono::milliseconds list_delay_{0};
};

} // namespace testing
} // namespace dock_dash
