#pragma once

#include "types/Device.hpp"
#include "types/SaveCandidate.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rs::backup {
class BackupSet;
}

namespace rs::sync {

// Picks, per save filename, the device holding the most recently modified
// copy inside one backup set.
class Catalog {
public:
    // Device order is the configured order and decides ties.
    explicit Catalog(std::vector<types::Device> devices);

    // Rebuilds the filename union from the device folders of an existing set.
    static Catalog scan(const backup::BackupSet& set, std::vector<types::Device> devices);

    void record(const std::string& filename);

    [[nodiscard]] const std::set<std::string>& filenames() const { return filenames_; }
    [[nodiscard]] const std::vector<types::Device>& devices() const { return devices_; }

    // Every device copy of filename present in set, newest first.
    [[nodiscard]] std::vector<types::SaveCandidate> candidates(const backup::BackupSet& set,
                                                               const std::string& filename) const;

    [[nodiscard]] std::optional<types::SaveCandidate> winner(const backup::BackupSet& set,
                                                             const std::string& filename) const;

    // One winner per filename that has at least one surviving candidate.
    [[nodiscard]] std::vector<types::Winner> reconcile(const backup::BackupSet& set) const;

    // Copies each winner into saveFolder and the set's "Latest Saves",
    // overwriting and keeping the winner's mtime.
    static void publish(const backup::BackupSet& set,
                        const std::vector<types::Winner>& winners,
                        const std::filesystem::path& saveFolder);

private:
    std::vector<types::Device> devices_;
    std::set<std::string> filenames_;
};

}
