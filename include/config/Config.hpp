#pragma once

#include "types/Device.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace rs::config {

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct PathsConfig {
    std::filesystem::path save_folder = "Saves";
    std::filesystem::path backup_root = "Backups";
};

struct BackupConfig {
    unsigned int max_backups = 10;
};

struct TransportConfig {
    std::chrono::seconds connect_timeout = std::chrono::seconds(10);
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum retrosync = spdlog::level::info;   // Run lifecycle and summaries
    spdlog::level::level_enum transport = spdlog::level::info;   // Connect, login, transfers
    spdlog::level::level_enum backup    = spdlog::level::info;   // Retention and backup set layout
    spdlog::level::level_enum sync      = spdlog::level::info;   // Reconciliation and publish
    spdlog::level::level_enum config    = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::optional<std::filesystem::path> log_dir;   // console only when unset
    LogLevelsConfig levels;
};

struct Config {
    std::vector<types::Device> devices;
    PathsConfig paths;
    BackupConfig backups;
    TransportConfig transport;
    LoggingConfig logging;

    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

std::filesystem::path expandHome(const std::filesystem::path& path);

} // namespace rs::config
