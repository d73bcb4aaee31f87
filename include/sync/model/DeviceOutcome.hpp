#pragma once

#include "types/Device.hpp"
#include "transport/Session.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rs::sync::model {

enum class DeviceStatus : uint8_t {
    Pending,
    Ready,            // downloaded, session retained for upload
    ConnectFailed,
    AuthFailed,
    PathFailed,
    TransferFailed
};

struct DeviceOutcome {
    types::Device device;
    DeviceStatus status{DeviceStatus::Pending};
    std::string error;

    std::vector<std::string> downloaded;
    std::vector<std::string> failed_downloads;
    std::vector<std::string> uploaded;
    std::vector<std::string> failed_uploads;

    // Set only when the download phase succeeded, consulted only by the upload phase.
    std::unique_ptr<transport::Session> session;

    explicit DeviceOutcome(types::Device device) : device(std::move(device)) {}

    [[nodiscard]] bool hasRetainedSession() const { return session && session->isOpen(); }
};

std::string to_string(DeviceStatus status);

}
