#include "sync/Catalog.hpp"
#include "backup/BackupSet.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fs = std::filesystem;
using namespace rs::sync;
using namespace rs::types;
using namespace rs::logging;

Catalog::Catalog(std::vector<Device> devices) : devices_(std::move(devices)) {}

Catalog Catalog::scan(const backup::BackupSet& set, std::vector<Device> devices) {
    Catalog catalog(std::move(devices));

    for (const auto& device : catalog.devices_) {
        const auto dir = set.devicePath(device.name());
        if (!fs::is_directory(dir)) continue;

        for (const auto& entry : fs::directory_iterator(dir))
            if (entry.is_regular_file()) catalog.record(entry.path().filename().string());
    }

    return catalog;
}

void Catalog::record(const std::string& filename) {
    filenames_.insert(filename);
}

std::vector<SaveCandidate> Catalog::candidates(const backup::BackupSet& set, const std::string& filename) const {
    std::vector<SaveCandidate> out;

    for (std::size_t i = 0; i < devices_.size(); ++i) {
        const auto& device = devices_[i];
        if (!set.contains(device.name(), filename)) continue;

        const auto path = set.devicePath(device.name()) / filename;
        out.push_back({
            .device = device.name(),
            .device_order = i,
            .last_modified = util::getModTime(path),
            .path = path
        });
    }

    // newest first, equal mtimes go to the device configured first
    std::ranges::sort(out, [](const SaveCandidate& a, const SaveCandidate& b) {
        if (a.last_modified != b.last_modified) return a.last_modified > b.last_modified;
        return a.device_order < b.device_order;
    });
    return out;
}

std::optional<SaveCandidate> Catalog::winner(const backup::BackupSet& set, const std::string& filename) const {
    auto list = candidates(set, filename);
    if (list.empty()) return std::nullopt;
    return std::move(list.front());
}

std::vector<Winner> Catalog::reconcile(const backup::BackupSet& set) const {
    std::vector<Winner> winners;

    for (const auto& filename : filenames_) {
        const auto list = candidates(set, filename);

        if (list.empty()) {
            LogRegistry::sync()->debug("[Catalog] {} has no surviving copy, skipping", filename);
            continue;
        }

        std::vector<std::string> described;
        described.reserve(list.size());
        for (const auto& c : list) described.push_back(to_string(c));
        LogRegistry::sync()->debug("[Catalog] {} [{}]", filename, fmt::join(described, ", "));

        winners.push_back({ .filename = filename, .candidate = list.front() });
    }

    return winners;
}

void Catalog::publish(const backup::BackupSet& set, const std::vector<Winner>& winners, const fs::path& saveFolder) {
    fs::create_directories(saveFolder);
    const auto latest = set.latestDir();

    for (const auto& w : winners) {
        util::copyPreservingModTime(w.candidate.path, saveFolder / w.filename);
        util::copyPreservingModTime(w.candidate.path, latest / w.filename);
        LogRegistry::sync()->info("[Catalog] {} <- {}", w.filename, to_string(w.candidate));
    }
}
