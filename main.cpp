// Config
#include "config/Config.hpp"

// Sync
#include "sync/Orchestrator.hpp"
#include "sync/RunContext.hpp"

// Transport
#include "transport/FtpSession.hpp"
#include "transport/curlWrappers.hpp"

// Misc
#include "logging/LogRegistry.hpp"

// Libraries
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace rs::config;
using namespace rs::sync;
using namespace rs::transport;
using namespace rs::logging;

namespace {

constexpr int EXIT_USAGE = 2;

constexpr auto USAGE =
    "usage: retrosync [-c|--config <file>] [-v|--verbose] [-h|--help]\n"
    "\n"
    "  -c, --config <file>   configuration file (default: $RETROSYNC_CONFIG or retrosync.yaml)\n"
    "  -v, --verbose         debug output on the console\n"
    "  -h, --help            show this help\n";

struct CliOptions {
    std::filesystem::path config = "retrosync.yaml";
    bool verbose = false;
    bool help = false;
};

std::optional<CliOptions> parseArgs(const int argc, char** argv) {
    CliOptions opts;
    if (const char* env = std::getenv("RETROSYNC_CONFIG"); env && *env) opts.config = env;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") opts.help = true;
        else if (arg == "-v" || arg == "--verbose") opts.verbose = true;
        else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "retrosync: " << arg << " requires a file argument\n";
                return std::nullopt;
            }
            opts.config = argv[++i];
        } else if (arg.starts_with("--config=")) {
            opts.config = std::string(arg.substr(9));
        } else {
            std::cerr << "retrosync: unknown argument '" << arg << "'\n";
            return std::nullopt;
        }
    }
    return opts;
}

void makeVerbose(LoggingConfig& logging) {
    auto& levels = logging.levels;
    levels.console_log_level = spdlog::level::debug;
    levels.subsystem_levels.retrosync = spdlog::level::debug;
    levels.subsystem_levels.transport = spdlog::level::debug;
    levels.subsystem_levels.backup = spdlog::level::debug;
    levels.subsystem_levels.sync = spdlog::level::debug;
    levels.subsystem_levels.config = spdlog::level::debug;
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        std::cerr << USAGE;
        return EXIT_USAGE;
    }
    if (opts->help) {
        std::cout << USAGE;
        return EXIT_SUCCESS;
    }

    Config cfg;
    try {
        cfg = loadConfig(opts->config);
    } catch (const ConfigError& e) {
        std::cerr << "[-] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (opts->verbose) makeVerbose(cfg.logging);

    try {
        LogRegistry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to initialize logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        LogRegistry::config()->debug("[*] Loaded {} device(s) from {}", cfg.devices.size(), opts->config.string());
        ensureCurlGlobalInit();

        Orchestrator orchestrator(RunContext::fromConfig(cfg), FtpSession::factory());
        const auto report = orchestrator.run();

        if (const auto failed = report.failedDeviceCount(); failed > 0)
            LogRegistry::retrosync()->warn("[!] {} of {} device(s) were skipped", failed, report.devices.size());
        else
            LogRegistry::retrosync()->info("[✓] All devices synced");

        LogRegistry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        LogRegistry::retrosync()->critical("[-] Sync aborted: {}", e.what());
        LogRegistry::shutdown();
        return EXIT_FAILURE;
    }
}
