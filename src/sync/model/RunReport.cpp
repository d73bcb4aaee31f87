#include "sync/model/RunReport.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace rs::sync::model {

std::string to_string(const DeviceStatus status) {
    switch (status) {
    case DeviceStatus::Pending: return "pending";
    case DeviceStatus::Ready: return "ready";
    case DeviceStatus::ConnectFailed: return "connect_failed";
    case DeviceStatus::AuthFailed: return "auth_failed";
    case DeviceStatus::PathFailed: return "path_failed";
    case DeviceStatus::TransferFailed: return "transfer_failed";
    }
    return "unknown";
}

DeviceSummary DeviceSummary::from(const DeviceOutcome& outcome) {
    return {
        .device = outcome.device.name(),
        .status = outcome.status,
        .error = outcome.error,
        .downloaded = outcome.downloaded,
        .failed_downloads = outcome.failed_downloads,
        .uploaded = outcome.uploaded,
        .failed_uploads = outcome.failed_uploads
    };
}

std::size_t RunReport::failedDeviceCount() const {
    return static_cast<std::size_t>(std::ranges::count_if(devices, [](const DeviceSummary& d) {
        return d.status != DeviceStatus::Ready;
    }));
}

void to_json(nlohmann::json& j, const DeviceSummary& s) {
    j = {
        {"device", s.device},
        {"status", to_string(s.status)},
        {"downloaded", s.downloaded},
        {"failed_downloads", s.failed_downloads},
        {"uploaded", s.uploaded},
        {"failed_uploads", s.failed_uploads}
    };
    if (!s.error.empty()) j["error"] = s.error;
}

void to_json(nlohmann::json& j, const RunReport& r) {
    std::vector<std::string> pruned;
    pruned.reserve(r.pruned.size());
    for (const auto& p : r.pruned) pruned.push_back(p.filename().string());

    j = {
        {"started_at", util::timestampToString(r.started_at)},
        {"finished_at", util::timestampToString(r.finished_at)},
        {"backup_set", r.backup_set.filename().string()},
        {"pruned", pruned},
        {"devices", r.devices},
        {"winners", r.winners}
    };
}

}

namespace rs::types {

void to_json(nlohmann::json& j, const Winner& w) {
    j = {
        {"filename", w.filename},
        {"device", w.candidate.device},
        {"last_modified", util::timestampToString(w.candidate.last_modified)}
    };
}

}
