#include <cstdlib>
#include <dock-dash/core/config.hpp>
#include <dock-dash/core/error.hpp>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace dock_dash {

namespace {

std::string trim(const std::string& text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::string unquote(const std::string& text)
{
    if (text.size() >= 2
        && ((text.front() == '"' && text.back() == '"')
            || (text.front() == '\'' && text.back() == '\''))) {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

} // namespace

const ConfigValue* ConfigManager::findValue(const std::string& key) const
{
    // Values set directly win over every layer
    auto it = config_data_.find(key);
    if (it != config_data_.end()) {
        return &it->second;
    }

    for (auto layer_it = layers_.rbegin(); layer_it != layers_.rend(); ++layer_it) {
        if (const ConfigValue* value = layer_it->second.findValue(key)) {
            return value;
        }
    }
    return nullptr;
}

std::optional<std::string> ConfigManager::getAsString(const std::string& key) const
{
    const ConfigValue* value = findValue(key);
    if (value == nullptr) {
        return std::nullopt;
    }

    return std::visit(
        [](const auto& v) -> std::string {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                return v;
            }
            else if constexpr (std::is_same_v<V, bool>) {
                return v ? "true" : "false";
            }
            else {
                std::ostringstream oss;
                oss << v;
                return oss.str();
            }
        },
        *value);
}

void ConfigManager::addLayer(const std::string& layer_name, const ConfigManager& other)
{
    layers_.emplace_back(layer_name, other.getEffectiveConfig());
}

ConfigManager ConfigManager::getEffectiveConfig() const
{
    ConfigManager result;

    for (const auto& [layer_name, layer_config] : layers_) {
        for (const auto& [key, value] : layer_config.config_data_) {
            result.config_data_[key] = value;
        }
    }
    for (const auto& [key, value] : config_data_) {
        result.config_data_[key] = value;
    }

    return result;
}

ConfigManager ConfigManager::expandEnvironmentVariables() const
{
    ConfigManager result = getEffectiveConfig();

    for (auto& [key, value] : result.config_data_) {
        if (std::holds_alternative<std::string>(value)) {
            value = expandValue(std::get<std::string>(value));
        }
    }

    return result;
}

std::string ConfigManager::expandValue(const std::string& value) const
{
    std::string result = value;
    size_t start = 0;

    while ((start = result.find("${", start)) != std::string::npos) {
        size_t end = result.find('}', start);
        if (end == std::string::npos) {
            break;
        }

        std::string var_name = result.substr(start + 2, end - start - 2);
        const char* env_value = std::getenv(var_name.c_str());

        if (env_value) {
            std::string replacement = env_value;
            result.replace(start, end - start + 1, replacement);
            start += replacement.length();
        }
        else {
            // Unknown variables stay as written
            start = end + 1;
        }
    }

    return result;
}

void ConfigManager::loadFromFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ContainerError(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        if (key.empty()) {
            continue;
        }
        set(key, unquote(trim(line.substr(eq_pos + 1))));
    }
}

void ConfigManager::loadFromEnvironment(const std::vector<std::string>& keys)
{
    for (const auto& key : keys) {
        if (const char* env_value = std::getenv(key.c_str())) {
            set<std::string>(key, env_value);
        }
    }
}

} // namespace dock_dash
