#pragma once

#include <chrono>
#include <string>

namespace rs::types {

// One file entry observed in a device's remote listing.
struct RemoteFile {
    std::string name;
    std::chrono::sys_seconds modified;

    RemoteFile(std::string name, std::chrono::sys_seconds modified);

    friend bool operator==(const RemoteFile&, const RemoteFile&) = default;
};

}
