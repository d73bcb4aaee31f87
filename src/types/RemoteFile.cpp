#include "types/RemoteFile.hpp"

#include <stdexcept>

namespace rs::types {

RemoteFile::RemoteFile(std::string name, const std::chrono::sys_seconds modified)
    : name(std::move(name)), modified(modified) {
    if (this->name.empty()) throw std::invalid_argument("Remote file name cannot be empty");
}

}
