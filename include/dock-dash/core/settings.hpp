#pragma once

#include <chrono>
#include <dock-dash/core/config.hpp>
#include <dock-dash/core/logger.hpp>
#include <string>
#include <vector>

namespace dock_dash {

constexpr double MIN_REFRESH_INTERVAL_SECONDS = 0.2;
constexpr std::chrono::milliseconds STATS_CACHE_TTL{2000};
constexpr size_t MAX_CONCURRENT_STATS_FETCHES = 4;

// Environment keys understood by DashboardSettings::fromConfig
extern const std::vector<std::string> SETTINGS_KEYS;

enum class ExecProfile { WSL, DOCKER };

/**
 * @brief Runtime settings of the dashboard
 *
 * Values are clamped on load so every consumer can rely on the bounds below.
 */
struct DashboardSettings {
    std::string app_title = "Docker Dashboard";
    std::string docker_host = "unix:///var/run/docker.sock";

    double refresh_interval_seconds = 10.0;   // floor MIN_REFRESH_INTERVAL_SECONDS
    int log_refresh_seconds = 5;              // >= 1
    int log_default_tail = 200;               // 1..log_max_tail
    int log_max_tail = 5000;                  // >= 1
    double action_delay_seconds = 0.1;        // >= 0

    std::string link_scheme = "http";
    std::string link_host = "localhost";

    std::string exec_shell = "bash";
    std::string wsl_distro = "Ubuntu";
    std::vector<ExecProfile> exec_profiles{ExecProfile::WSL, ExecProfile::DOCKER};

    LogLevel log_level = LogLevel::INFO;

    std::chrono::milliseconds refreshInterval() const;
    std::chrono::milliseconds actionDelay() const;

    // Filesystem path of the daemon socket taken from docker_host
    std::string socketPath() const;

    static DashboardSettings fromConfig(const ConfigManager& config);

    // Environment over an optional key = value file
    static DashboardSettings load(const std::string& config_file = "");
};

std::vector<ExecProfile> parseExecProfiles(const std::string& text);

} // namespace dock_dash
