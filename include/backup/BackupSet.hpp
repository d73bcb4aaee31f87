#pragma once

#include <filesystem>
#include <string>

namespace rs::backup {

// One run's snapshot: <root>/<timestamp>/<device>/... plus "Latest Saves".
class BackupSet {
public:
    static constexpr auto LATEST_SAVES_DIR = "Latest Saves";

    explicit BackupSet(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }
    [[nodiscard]] std::string name() const { return root_.filename().string(); }

    [[nodiscard]] std::filesystem::path devicePath(const std::string& device) const { return root_ / device; }
    [[nodiscard]] std::filesystem::path latestPath() const { return root_ / LATEST_SAVES_DIR; }

    // Created on first use
    std::filesystem::path deviceDir(const std::string& device) const;
    std::filesystem::path latestDir() const;

    [[nodiscard]] bool contains(const std::string& device, const std::string& filename) const;

private:
    std::filesystem::path root_;
};

}
