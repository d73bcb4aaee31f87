#pragma once

#include "types/Device.hpp"

#include <chrono>
#include <filesystem>
#include <vector>

namespace rs::config {
struct Config;
}

namespace rs::sync {

// Everything one run needs, built once and handed to the Orchestrator.
struct RunContext {
    std::vector<types::Device> devices;
    std::filesystem::path save_folder;
    std::filesystem::path backup_root;
    unsigned int max_backups{10};
    std::chrono::seconds connect_timeout{10};

    static RunContext fromConfig(const config::Config& cfg);
};

}
