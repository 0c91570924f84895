#include <cstdlib>
#include <dtop/core/config.hpp>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <sstream>

namespace dtop {

namespace {

std::filesystem::path homeDir()
{
    const char* home = std::getenv("HOME");
    return home ? std::filesystem::path(home) : std::filesystem::current_path();
}

HostEntry parseHostEntry(const nlohmann::json& j)
{
    HostEntry entry;
    if (j.is_string()) {
        entry.spec = j.get<std::string>();
        return entry;
    }

    if (!j.is_object() || !j.contains("host") || !j["host"].is_string()) {
        throw DtopError(ErrorCode::CONFIG_INVALID,
                        "Host entries must be strings or objects with a \"host\" string");
    }

    entry.spec = j["host"].get<std::string>();
    for (const char* viewer_key : {"viewer", "dozzle"}) {
        if (j.contains(viewer_key) && j[viewer_key].is_string()) {
            entry.viewer_url = j[viewer_key].get<std::string>();
            break;
        }
    }
    return entry;
}

} // namespace

ConfigValue ConfigManager::getValue(const std::string& key) const
{
    auto it = config_data_.find(key);
    if (it != config_data_.end()) {
        return it->second;
    }

    // Last layer has higher priority than earlier layers
    for (auto layer_it = layers_.rbegin(); layer_it != layers_.rend(); ++layer_it) {
        if (layer_it->second.has(key)) {
            return layer_it->second.getValue(key);
        }
    }

    throw DtopError(ErrorCode::CONFIG_MISSING, "Configuration key not found: " + key);
}

bool ConfigManager::has(const std::string& key) const
{
    if (config_data_.find(key) != config_data_.end()) {
        return true;
    }

    for (const auto& layer : layers_) {
        if (layer.second.has(key)) {
            return true;
        }
    }

    return false;
}

void ConfigManager::remove(const std::string& key)
{
    config_data_.erase(key);
}

void ConfigManager::addLayer(const std::string& layer_name, const ConfigManager& other)
{
    layers_.emplace_back(layer_name, other);
}

ConfigManager ConfigManager::getEffectiveConfig() const
{
    ConfigManager result;

    for (const auto& [layer_name, layer_config] : layers_) {
        ConfigManager flattened = layer_config.getEffectiveConfig();
        for (const auto& [key, value] : flattened.config_data_) {
            result.config_data_[key] = value;
        }
        if (flattened.hosts_) {
            result.hosts_ = flattened.hosts_;
        }
    }

    // Own values win over every layer
    for (const auto& [key, value] : config_data_) {
        result.config_data_[key] = value;
    }
    if (hosts_) {
        result.hosts_ = hosts_;
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

    if (result.hosts_) {
        for (auto& host : *result.hosts_) {
            host.spec = expandValue(host.spec);
            if (host.viewer_url) {
                host.viewer_url = expandValue(*host.viewer_url);
            }
        }
    }

    return result;
}

std::string ConfigManager::expandValue(const std::string& value)
{
    std::string result = value;
    size_t start = 0;

    while ((start = result.find("${", start)) != std::string::npos) {
        size_t end = result.find('}', start);
        if (end == std::string::npos) {
            break; // Malformed input
        }

        std::string var_name = result.substr(start + 2, end - start - 2);
        const char* env_value = std::getenv(var_name.c_str());

        if (env_value) {
            std::string replacement = env_value;
            result.replace(start, end - start + 1, replacement);
            start += replacement.length();
        }
        else {
            // Environment variable not found, leave pattern unchanged
            start = end + 1;
        }
    }

    return result;
}

void ConfigManager::loadFromJsonFile(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw DtopError(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    loadFromJsonString(buffer.str());
}

void ConfigManager::loadFromJsonString(const std::string& json_string)
{
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(json_string);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw DtopError(ErrorCode::CONFIG_INVALID,
                        "Invalid JSON configuration: " + std::string(e.what()));
    }

    if (!json.is_object()) {
        throw DtopError(ErrorCode::CONFIG_INVALID, "Configuration root must be an object");
    }

    std::function<void(const nlohmann::json&, const std::string&)> process_json =
        [&](const nlohmann::json& j, const std::string& prefix) {
            if (prefix == "hosts") {
                if (!j.is_array()) {
                    throw DtopError(ErrorCode::CONFIG_INVALID, "\"hosts\" must be an array");
                }
                std::vector<HostEntry> hosts;
                for (const auto& item : j) {
                    hosts.push_back(parseHostEntry(item));
                }
                hosts_ = std::move(hosts);
            }
            else if (j.is_object()) {
                for (auto& [key, value] : j.items()) {
                    process_json(value, prefix.empty() ? key : prefix + "." + key);
                }
            }
            else if (j.is_string()) {
                set(prefix, j.get<std::string>());
            }
            else if (j.is_number_integer()) {
                set(prefix, j.get<int>());
            }
            else if (j.is_number_float()) {
                set(prefix, j.get<double>());
            }
            else if (j.is_boolean()) {
                set(prefix, j.get<bool>());
            }
        };

    process_json(json, "");
}

const std::vector<HostEntry>& ConfigManager::hosts() const
{
    static const std::vector<HostEntry> empty;
    if (hosts_) {
        return *hosts_;
    }
    for (auto layer_it = layers_.rbegin(); layer_it != layers_.rend(); ++layer_it) {
        const auto& layer_hosts = layer_it->second.hosts();
        if (!layer_hosts.empty()) {
            return layer_hosts;
        }
    }
    return empty;
}

void ConfigManager::setHosts(std::vector<HostEntry> hosts)
{
    hosts_ = std::move(hosts);
}

Settings Settings::fromConfig(const ConfigManager& config)
{
    Settings settings;

    settings.hosts = config.hosts();
    if (settings.hosts.empty()) {
        settings.hosts.push_back(HostEntry{"local", std::nullopt});
    }

    settings.log_level = config.get<std::string>("log.level", settings.log_level);
    settings.log_file = config.get<std::string>("log.file", defaultLogPath().string());

    auto positive = [&](const std::string& key, int fallback) {
        int value = config.get<int>(key, fallback);
        if (value <= 0) {
            throw DtopError(ErrorCode::CONFIG_INVALID, key + " must be positive");
        }
        return value;
    };

    settings.tick = std::chrono::milliseconds(positive("ui.tick_ms", 500));
    settings.channel_capacity = static_cast<size_t>(positive("channel.capacity", 1000));
    settings.ping_timeout = std::chrono::seconds(positive("connect.ping_timeout_s", 10));
    settings.startup_timeout = std::chrono::seconds(positive("connect.startup_timeout_s", 30));
    settings.log_batch_size = static_cast<size_t>(positive("logs.batch_size", 1000));
    settings.docker_cert_path = config.get<std::string>("docker.cert_path", defaultDockerCertPath().string());

    return settings;
}

std::filesystem::path defaultConfigPath()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path base = (xdg && *xdg) ? std::filesystem::path(xdg) : homeDir() / ".config";
    return base / "dtop" / "config.json";
}

std::filesystem::path defaultLogPath()
{
    const char* xdg = std::getenv("XDG_STATE_HOME");
    std::filesystem::path base =
        (xdg && *xdg) ? std::filesystem::path(xdg) : homeDir() / ".local" / "state";
    return base / "dtop" / "dtop.log";
}

std::filesystem::path defaultDockerCertPath()
{
    const char* env = std::getenv("DOCKER_CERT_PATH");
    if (env && *env) {
        return std::filesystem::path(env);
    }
    return homeDir() / ".docker";
}

} // namespace dtop
