#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace rs::types {

struct Credentials {
    std::string username;
    std::string password;

    friend bool operator==(const Credentials&, const Credentials&) = default;
};

// A configured sync endpoint. Immutable once constructed; the constructor
// rejects anything that could not name a backup subdirectory or reach a host.
class Device {
public:
    Device(std::string name,
           std::string hostname,
           uint16_t port,
           std::string remote_path,
           std::optional<Credentials> credentials = std::nullopt);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& hostname() const { return hostname_; }
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] const std::string& remotePath() const { return remote_path_; }
    [[nodiscard]] const std::optional<Credentials>& credentials() const { return credentials_; }
    [[nodiscard]] bool isAnonymous() const { return !credentials_.has_value(); }

    [[nodiscard]] std::string endpoint() const;

    // Some FTP daemons report the listed directory itself as the first entry.
    [[nodiscard]] bool isListingArtifact(const std::string& filename) const;

    friend bool operator==(const Device&, const Device&) = default;

private:
    std::string name_;
    std::string hostname_;
    uint16_t port_;
    std::string remote_path_;
    std::optional<Credentials> credentials_;
};

std::string to_string(const Device& device);

}
