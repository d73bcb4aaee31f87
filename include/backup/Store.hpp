#pragma once

#include "backup/BackupSet.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace rs::backup {

struct BackupError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Retention and layout of the backup root. Every filesystem failure here is
// fatal for the run, there is nowhere safe to stage downloads without it.
class Store {
public:
    explicit Store(std::filesystem::path root);

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    void ensureRoot() const;

    // Backup set directories sorted by name, oldest first.
    [[nodiscard]] std::vector<std::filesystem::path> list() const;

    // Deletes the oldest sets one at a time, re-listing after each, until
    // fewer than maxCount remain. Returns the removed paths.
    std::vector<std::filesystem::path> prune(unsigned int maxCount) const;

    // Named after now in UTC; a set created within the same second gets a
    // two-digit "-NN" suffix so names keep sorting chronologically.
    [[nodiscard]] BackupSet createNewSet(
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

private:
    std::filesystem::path root_;
};

}
