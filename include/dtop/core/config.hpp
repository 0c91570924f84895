#pragma once

#include <chrono>
#include <dtop/core/error.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace dtop {

using ConfigValue = std::variant<std::string, int, double, bool>;

/**
 * @brief One configured Docker host and its optional external log viewer
 */
struct HostEntry {
    std::string spec;
    std::optional<std::string> viewer_url;
};

/**
 * @brief Layered key/value configuration
 *
 * Values live in named layers; later layers win. Nested JSON objects are
 * flattened to dotted keys ("log.level"). The "hosts" array is kept apart
 * because it is a list, not a scalar.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    template <typename T>
    void set(const std::string& key, const T& value);

    template <typename T>
    T get(const std::string& key) const;

    template <typename T>
    T get(const std::string& key, const T& default_value) const;

    bool has(const std::string& key) const;
    void remove(const std::string& key);

    // Layers, lowest priority first
    void addLayer(const std::string& layer_name, const ConfigManager& other);
    size_t getLayerCount() const
    {
        return layers_.size();
    }
    ConfigManager getEffectiveConfig() const;

    // Replaces ${VAR} in string values with the environment's value
    ConfigManager expandEnvironmentVariables() const;
    static std::string expandValue(const std::string& value);

    // JSON loading; throws DtopError(FILE_NOT_FOUND / CONFIG_INVALID)
    void loadFromJsonFile(const std::filesystem::path& file_path);
    void loadFromJsonString(const std::string& json_string);

    const std::vector<HostEntry>& hosts() const;
    void setHosts(std::vector<HostEntry> hosts);

private:
    ConfigValue getValue(const std::string& key) const;

    std::unordered_map<std::string, ConfigValue> config_data_;
    std::optional<std::vector<HostEntry>> hosts_;
    std::vector<std::pair<std::string, ConfigManager>> layers_;
};

/**
 * @brief Typed view of the settings the engine reads
 */
struct Settings {
    std::vector<HostEntry> hosts;
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::chrono::milliseconds tick{500};
    size_t channel_capacity = 1000;
    std::chrono::seconds ping_timeout{10};
    std::chrono::seconds startup_timeout{30};
    size_t log_batch_size = 1000;
    std::filesystem::path docker_cert_path;

    static Settings fromConfig(const ConfigManager& config);
};

/**
 * @brief Config file location: $XDG_CONFIG_HOME/dtop/config.json or
 * ~/.config/dtop/config.json
 */
std::filesystem::path defaultConfigPath();

/**
 * @brief Log file location under $XDG_STATE_HOME or ~/.local/state
 */
std::filesystem::path defaultLogPath();

/**
 * @brief Directory holding ca.pem, cert.pem and key.pem for tls:// hosts:
 * $DOCKER_CERT_PATH, otherwise ~/.docker
 */
std::filesystem::path defaultDockerCertPath();

// Template implementations
template <typename T>
void ConfigManager::set(const std::string& key, const T& value)
{
    config_data_[key] = value;
}

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    auto value = getValue(key);
    try {
        return std::get<T>(value);
    }
    catch (const std::bad_variant_access&) {
        throw DtopError(ErrorCode::INVALID_TYPE, "Invalid type for configuration key: " + key);
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, const T& default_value) const
{
    if (!has(key)) {
        return default_value;
    }
    return get<T>(key);
}

} // namespace dtop
