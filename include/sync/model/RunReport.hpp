#pragma once

#include "sync/model/DeviceOutcome.hpp"
#include "types/SaveCandidate.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace rs::sync::model {

struct DeviceSummary {
    std::string device;
    DeviceStatus status{DeviceStatus::Pending};
    std::string error;
    std::vector<std::string> downloaded, failed_downloads, uploaded, failed_uploads;

    static DeviceSummary from(const DeviceOutcome& outcome);
};

struct RunReport {
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    std::filesystem::path backup_set;
    std::vector<std::filesystem::path> pruned;
    std::vector<DeviceSummary> devices;
    std::vector<types::Winner> winners;

    [[nodiscard]] std::size_t failedDeviceCount() const;
};

void to_json(nlohmann::json& j, const DeviceSummary& s);
void to_json(nlohmann::json& j, const RunReport& r);

}

namespace rs::types {
void to_json(nlohmann::json& j, const Winner& w);
}
