#include <algorithm>
#include <cctype>
#include <cmath>
#include <dock-dash/core/error.hpp>
#include <dock-dash/core/settings.hpp>
#include <sstream>
#include <stdexcept>

namespace dock_dash {

const std::vector<std::string> SETTINGS_KEYS = {
    "APP_TITLE",        "DOCKER_HOST",          "AUTO_REFRESH_SECONDS", "LOG_REFRESH_SECONDS",
    "LOG_DEFAULT_TAIL", "LOG_MAX_TAIL",         "ACTION_DELAY_SECONDS", "LINK_SCHEME",
    "LINK_HOST",        "EXEC_SHELL",           "WSL_DISTRO",           "EXEC_COMMAND_PROFILES",
    "LOG_LEVEL"};

namespace {

constexpr const char* UNIX_SCHEME = "unix://";

std::string lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trimmed(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(" \t") - first + 1);
}

std::string getText(const ConfigManager& config, const std::string& key, const std::string& def)
{
    auto value = config.getAsString(key);
    return value ? *value : def;
}

// Malformed numbers keep the default, as with an unset key
int getInt(const ConfigManager& config, const std::string& key, int def)
{
    auto value = config.getAsString(key);
    if (!value) {
        return def;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(trimmed(*value), &consumed);
        return consumed == trimmed(*value).size() ? parsed : def;
    }
    catch (const std::logic_error&) {
        return def;
    }
}

double getDouble(const ConfigManager& config, const std::string& key, double def)
{
    auto value = config.getAsString(key);
    if (!value) {
        return def;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(trimmed(*value), &consumed);
        if (consumed != trimmed(*value).size() || !std::isfinite(parsed)) {
            return def;
        }
        return parsed;
    }
    catch (const std::logic_error&) {
        return def;
    }
}

} // namespace

std::vector<ExecProfile> parseExecProfiles(const std::string& text)
{
    std::vector<ExecProfile> profiles;
    auto add = [&profiles](ExecProfile profile) {
        if (std::find(profiles.begin(), profiles.end(), profile) == profiles.end()) {
            profiles.push_back(profile);
        }
    };

    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = lower(trimmed(item));
        if (item == "all") {
            add(ExecProfile::WSL);
            add(ExecProfile::DOCKER);
        }
        else if (item == "wsl") {
            add(ExecProfile::WSL);
        }
        else if (item == "docker" || item == "host") {
            add(ExecProfile::DOCKER);
        }
    }

    if (profiles.empty()) {
        profiles = {ExecProfile::WSL, ExecProfile::DOCKER};
    }
    return profiles;
}

std::chrono::milliseconds DashboardSettings::refreshInterval() const
{
    return std::chrono::milliseconds(static_cast<long long>(std::llround(
        std::max(refresh_interval_seconds, MIN_REFRESH_INTERVAL_SECONDS) * 1000.0)));
}

std::chrono::milliseconds DashboardSettings::actionDelay() const
{
    return std::chrono::milliseconds(
        static_cast<long long>(std::llround(std::max(action_delay_seconds, 0.0) * 1000.0)));
}

std::string DashboardSettings::socketPath() const
{
    if (docker_host.rfind(UNIX_SCHEME, 0) == 0) {
        return docker_host.substr(std::char_traits<char>::length(UNIX_SCHEME));
    }
    throw ContainerError(ErrorCode::CONFIG_INVALID,
                         "Only unix:// docker hosts are supported: " + docker_host);
}

DashboardSettings DashboardSettings::fromConfig(const ConfigManager& config)
{
    DashboardSettings settings;

    settings.app_title = getText(config, "APP_TITLE", settings.app_title);
    settings.docker_host = getText(config, "DOCKER_HOST", settings.docker_host);

    settings.refresh_interval_seconds =
        std::max(MIN_REFRESH_INTERVAL_SECONDS,
                 getDouble(config, "AUTO_REFRESH_SECONDS", settings.refresh_interval_seconds));
    settings.log_refresh_seconds =
        std::max(1, getInt(config, "LOG_REFRESH_SECONDS", settings.log_refresh_seconds));
    settings.log_max_tail = std::max(1, getInt(config, "LOG_MAX_TAIL", settings.log_max_tail));
    settings.log_default_tail =
        std::min(std::max(1, getInt(config, "LOG_DEFAULT_TAIL", settings.log_default_tail)),
                 settings.log_max_tail);
    settings.action_delay_seconds =
        std::max(0.0, getDouble(config, "ACTION_DELAY_SECONDS", settings.action_delay_seconds));

    settings.link_scheme = getText(config, "LINK_SCHEME", settings.link_scheme);
    settings.link_host = getText(config, "LINK_HOST", settings.link_host);

    settings.exec_shell = getText(config, "EXEC_SHELL", settings.exec_shell);
    settings.wsl_distro = getText(config, "WSL_DISTRO", settings.wsl_distro);
    settings.exec_profiles = parseExecProfiles(getText(config, "EXEC_COMMAND_PROFILES", "all"));

    settings.log_level = fromString(getText(config, "LOG_LEVEL", "INFO"));

    return settings;
}

DashboardSettings DashboardSettings::load(const std::string& config_file)
{
    ConfigManager file_config;
    if (!config_file.empty()) {
        file_config.loadFromFile(config_file);
    }

    ConfigManager env_config;
    env_config.loadFromEnvironment(SETTINGS_KEYS);

    ConfigManager config;
    config.addLayer("file", file_config.expandEnvironmentVariables());
    config.addLayer("environment", env_config);

    return fromConfig(config);
}

} // namespace dock_dash
