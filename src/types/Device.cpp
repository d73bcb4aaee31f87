#include "types/Device.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace rs::types {

static constexpr auto LATEST_SAVES_DIR = "Latest Saves";

Device::Device(std::string name,
               std::string hostname,
               const uint16_t port,
               std::string remote_path,
               std::optional<Credentials> credentials)
    : name_(std::move(name)),
      hostname_(std::move(hostname)),
      port_(port),
      remote_path_(std::move(remote_path)),
      credentials_(std::move(credentials)) {
    if (name_.empty()) throw std::invalid_argument("Device name cannot be empty");
    if (name_ == "." || name_ == ".." || name_ == LATEST_SAVES_DIR || name_.find('/') != std::string::npos)
        throw std::invalid_argument(fmt::format("Device name '{}' cannot be used as a backup folder name", name_));
    if (hostname_.empty()) throw std::invalid_argument(fmt::format("Device '{}' has no hostname", name_));
    if (port_ == 0) throw std::invalid_argument(fmt::format("Device '{}' has an invalid port 0", name_));
    if (remote_path_.empty()) throw std::invalid_argument(fmt::format("Device '{}' has no remote path", name_));
    if (credentials_ && credentials_->username.empty())
        throw std::invalid_argument(fmt::format("Device '{}' has a password but no username", name_));
}

std::string Device::endpoint() const {
    return fmt::format("{}:{}", hostname_, port_);
}

bool Device::isListingArtifact(const std::string& filename) const {
    std::string_view stripped = filename;
    if (!stripped.empty() && stripped.front() == '/') stripped.remove_prefix(1);
    if (stripped.empty()) return true;
    return remote_path_.find(stripped) != std::string::npos;
}

std::string to_string(const Device& device) {
    return fmt::format("{} ({}, path '{}', {})", device.name(), device.endpoint(), device.remotePath(),
                       device.isAnonymous() ? "anonymous" : "user " + device.credentials()->username);
}

}
