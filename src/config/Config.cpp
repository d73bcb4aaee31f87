#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace rs::config {

namespace {

types::Device decodeDevice(const YAML::Node& node, const std::size_t index) {
    if (!node.IsMap()) throw ConfigError(fmt::format("devices[{}] must be a mapping", index));

    std::optional<types::Credentials> creds;
    if (node["username"] || node["password"]) {
        creds = types::Credentials{
            .username = node["username"].as<std::string>(""),
            .password = node["password"].as<std::string>("")
        };
    }

    const auto port = node["port"] ? node["port"].as<unsigned int>() : 21u;
    if (port > 65535) throw ConfigError(fmt::format("devices[{}] port {} is out of range", index, port));

    try {
        return {
            node["name"].as<std::string>(""),
            node["hostname"].as<std::string>(""),
            static_cast<uint16_t>(port),
            node["path"].as<std::string>(""),
            std::move(creds)
        };
    } catch (const std::invalid_argument& e) {
        throw ConfigError(fmt::format("devices[{}]: {}", index, e.what()));
    }
}

Config decode(const YAML::Node& root) {
    Config cfg;
    if (!root.IsMap()) throw ConfigError("Configuration root must be a mapping");

    if (const auto node = root["devices"]) {
        if (!node.IsSequence()) throw ConfigError("'devices' must be a list");
        for (std::size_t i = 0; i < node.size(); ++i) cfg.devices.push_back(decodeDevice(node[i], i));
    }

    if (const auto node = root["paths"]; node && !YAML::convert<PathsConfig>::decode(node, cfg.paths))
        throw ConfigError("'paths' must be a mapping");
    if (const auto node = root["backups"]; node && !YAML::convert<BackupConfig>::decode(node, cfg.backups))
        throw ConfigError("'backups' must be a mapping");
    if (const auto node = root["transport"]; node && !YAML::convert<TransportConfig>::decode(node, cfg.transport))
        throw ConfigError("'transport' must be a mapping");
    if (const auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
        throw ConfigError("'logging' must be a mapping");

    cfg.validate();
    return cfg;
}

}

void Config::validate() const {
    if (devices.empty()) throw ConfigError("At least one device must be configured");

    std::unordered_set<std::string> names;
    for (const auto& d : devices)
        if (!names.insert(d.name()).second) throw ConfigError(fmt::format("Duplicate device name '{}'", d.name()));

    if (paths.save_folder.empty()) throw ConfigError("paths.save_folder cannot be empty");
    if (paths.backup_root.empty()) throw ConfigError("paths.backup_root cannot be empty");
    if (backups.max_backups < 1) throw ConfigError("backups.max_backups must be at least 1");
    if (transport.connect_timeout < std::chrono::seconds(1))
        throw ConfigError("transport.connect_timeout_seconds must be at least 1");
}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return decode(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to load config '{}': {}", path.string(), e.what()));
    }
}

Config parseConfig(const std::string& yaml) {
    try {
        return decode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to parse config: {}", e.what()));
    }
}

std::filesystem::path expandHome(const std::filesystem::path& path) {
    const auto str = path.string();
    if (str != "~" && !str.starts_with("~/")) return path;

    const char* home = std::getenv("HOME");
    if (!home || !*home) throw ConfigError(fmt::format("Cannot expand '{}': HOME is not set", str));
    if (str == "~") return home;
    return std::filesystem::path(home) / str.substr(2);
}

} // namespace rs::config
