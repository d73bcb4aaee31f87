#include "logging/LogRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace rs::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a log directory is configured
    if (cnf.log_dir) {
        namespace fs = std::filesystem;
        if (!fs::exists(*cnf.log_dir)) fs::create_directories(*cnf.log_dir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (*cnf.log_dir / "retrosync.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("retrosync", sub_levels.retrosync);
    makeLogger("transport", sub_levels.transport);
    makeLogger("backup",    sub_levels.backup);
    makeLogger("sync",      sub_levels.sync);
    makeLogger("config",    sub_levels.config);

    initialized_ = true;
    get("retrosync")->debug("[LogRegistry] Initialized");
}

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

}
