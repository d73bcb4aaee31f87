#include "transport/Session.hpp"
#include "util/files.hpp"

namespace rs::transport {

void Session::download(const types::RemoteFile& file, const std::filesystem::path& dest) {
    fetch(file.name, dest);
    util::setModTime(dest, file.modified);
}

}
