#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace rs::types {

struct SaveCandidate {
    std::string device;
    std::size_t device_order{0};                      // position in the configured device list
    std::chrono::system_clock::time_point last_modified{};
    std::filesystem::path path;                        // copy inside the backup set
};

struct Winner {
    std::string filename;
    SaveCandidate candidate;
};

std::string to_string(const SaveCandidate& candidate);

}
