#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<PathsConfig> {
    static Node encode(const PathsConfig& rhs) {
        Node node;
        node["save_folder"] = rhs.save_folder.string();
        node["backup_root"] = rhs.backup_root.string();
        return node;
    }

    static bool decode(const Node& node, PathsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["save_folder"]) rhs.save_folder = expandHome(node["save_folder"].as<std::string>());
        if (node["backup_root"]) rhs.backup_root = expandHome(node["backup_root"].as<std::string>());
        return true;
    }
};

template<>
struct convert<BackupConfig> {
    static Node encode(const BackupConfig& rhs) {
        Node node;
        node["max_backups"] = rhs.max_backups;
        return node;
    }

    static bool decode(const Node& node, BackupConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["max_backups"]) rhs.max_backups = node["max_backups"].as<unsigned int>();
        return true;
    }
};

template<>
struct convert<TransportConfig> {
    static Node encode(const TransportConfig& rhs) {
        Node node;
        node["connect_timeout_seconds"] = rhs.connect_timeout.count();
        return node;
    }

    static bool decode(const Node& node, TransportConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["connect_timeout_seconds"])
            rhs.connect_timeout = std::chrono::seconds(node["connect_timeout_seconds"].as<long>());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["retrosync"] = to_std_string(spdlog::level::to_string_view(rhs.retrosync));
        node["transport"] = to_std_string(spdlog::level::to_string_view(rhs.transport));
        node["backup"]    = to_std_string(spdlog::level::to_string_view(rhs.backup));
        node["sync"]      = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.retrosync = spdlog::level::from_str(node["retrosync"].as<std::string>("info"));
        rhs.transport = spdlog::level::from_str(node["transport"].as<std::string>("info"));
        rhs.backup = spdlog::level::from_str(node["backup"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        if (rhs.log_dir) node["log_dir"] = rhs.log_dir->string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto dir = node["log_dir"]) rhs.log_dir = expandHome(dir.as<std::string>());
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
