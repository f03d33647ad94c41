#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace dock_dash {

using ConfigValue = std::variant<std::string, int, double, bool>;

class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    template <typename T>
    void set(const std::string& key, const T& value);

    // Renders any stored alternative as text; nullopt when the key is absent
    std::optional<std::string> getAsString(const std::string& key) const;

    // Configuration layers, later layers override earlier ones
    void addLayer(const std::string& layer_name, const ConfigManager& other);
    ConfigManager getEffectiveConfig() const;

    // Environment variable expansion
    ConfigManager expandEnvironmentVariables() const;
    std::string expandValue(const std::string& value) const;

    // Sources
    void loadFromFile(const std::string& filename);
    void loadFromEnvironment(const std::vector<std::string>& keys);

    ConfigManager(const ConfigManager&) = default;
    ConfigManager& operator=(const ConfigManager&) = default;
    ConfigManager(ConfigManager&&) = default;
    ConfigManager& operator=(ConfigManager&&) = default;

private:
    std::unordered_map<std::string, ConfigValue> config_data_;
    std::vector<std::pair<std::string, ConfigManager>> layers_;

    const ConfigValue* findValue(const std::string& key) const;
};

// Template implementations
template <typename T>
void ConfigManager::set(const std::string& key, const T& value)
{
    config_data_[key] = value;
}

} // namespace dock_dash
