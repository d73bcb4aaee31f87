#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rs::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Drops every registered logger; init() may be called again afterwards.
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> retrosync() { return get("retrosync"); }
    static std::shared_ptr<spdlog::logger> transport() { return get("transport"); }
    static std::shared_ptr<spdlog::logger> backup()    { return get("backup"); }
    static std::shared_ptr<spdlog::logger> sync()      { return get("sync"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 5 * 1024 * 1024; // 5 MiB
    static inline size_t main_max_files_ = 3;
};

}
