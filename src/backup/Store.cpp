#include "backup/Store.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace fs = std::filesystem;
using namespace rs::logging;

namespace rs::backup {

Store::Store(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) throw std::invalid_argument("Backup root cannot be empty");
}

void Store::ensureRoot() const {
    if (fs::is_directory(root_)) return;
    if (fs::exists(root_)) throw BackupError(fmt::format("Backup root '{}' exists and is not a directory", root_.string()));
    fs::create_directories(root_);
    LogRegistry::backup()->info("[Store] Created backup root {}", root_.string());
}

std::vector<fs::path> Store::list() const {
    std::vector<fs::path> sets;
    for (const auto& entry : fs::directory_iterator(root_))
        if (entry.is_directory()) sets.push_back(entry.path());

    std::ranges::sort(sets, {}, [](const fs::path& p) { return p.filename().string(); });
    return sets;
}

std::vector<fs::path> Store::prune(const unsigned int maxCount) const {
    if (maxCount == 0) throw std::invalid_argument("Retention cap must be at least 1");

    std::vector<fs::path> removed;
    auto sets = list();
    while (sets.size() >= maxCount) {
        const auto oldest = sets.front();
        LogRegistry::backup()->info("[Store] Removing old backup {}", oldest.filename().string());
        fs::remove_all(oldest);
        removed.push_back(oldest);
        sets = list();
    }
    return removed;
}

BackupSet Store::createNewSet(const std::chrono::system_clock::time_point now) const {
    const auto stamp = util::backupSetStamp(now);

    auto dir = root_ / stamp;
    for (unsigned int n = 1; fs::exists(dir); ++n) dir = root_ / fmt::format("{}-{:02}", stamp, n);

    if (!fs::create_directory(dir))
        throw BackupError(fmt::format("Failed to create backup set '{}'", dir.string()));

    LogRegistry::backup()->info("[Store] Created backup set {}", dir.filename().string());
    return BackupSet(dir);
}

}
