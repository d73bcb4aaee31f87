#include "backup/BackupSet.hpp"

namespace fs = std::filesystem;

namespace rs::backup {

BackupSet::BackupSet(fs::path root) : root_(std::move(root)) {}

fs::path BackupSet::deviceDir(const std::string& device) const {
    const auto dir = devicePath(device);
    fs::create_directories(dir);
    return dir;
}

fs::path BackupSet::latestDir() const {
    const auto dir = latestPath();
    fs::create_directories(dir);
    return dir;
}

bool BackupSet::contains(const std::string& device, const std::string& filename) const {
    std::error_code ec;
    return fs::is_regular_file(devicePath(device) / filename, ec);
}

}
