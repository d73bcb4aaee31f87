#pragma once

#include "types/Device.hpp"
#include "types/RemoteFile.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rs::transport::mlsd {

enum class EntryType { File, Dir, CurrentDir, ParentDir, Other };

struct Entry {
    EntryType type{EntryType::File};    // the type fact is optional, untyped entries are files
    std::string name;
    std::optional<std::chrono::sys_seconds> modified;
};

/*  https://tools.ietf.org/html/rfc3659
    type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .
    type=file;size=4;modify=20170113063314.000;UNIX.mode=0600; readme.txt   */
// throws std::invalid_argument on a line without a name
Entry parseLine(std::string_view line);

std::vector<std::string_view> splitLines(std::string_view listing);

// Regular files of one MLSD reply, sorted by name. Directories, unreadable
// lines, entries without a modify time and the device's listing artifacts
// are dropped.
std::vector<types::RemoteFile> parseListing(std::string_view listing, const types::Device& device);

}
