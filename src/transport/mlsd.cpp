#include "transport/mlsd.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rs::transport::mlsd {

namespace {

bool startsWithNoCase(const std::string_view s, const std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(), [](const unsigned char a, const unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

bool equalNoCase(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() && startsWithNoCase(a, b);
}

EntryType parseType(std::string_view value) {
    if (const auto colon = value.find(':'); colon != std::string_view::npos) value = value.substr(0, colon);
    if (equalNoCase(value, "file")) return EntryType::File;
    if (equalNoCase(value, "dir")) return EntryType::Dir;
    if (equalNoCase(value, "cdir")) return EntryType::CurrentDir;
    if (equalNoCase(value, "pdir")) return EntryType::ParentDir;
    return EntryType::Other;
}

}

Entry parseLine(std::string_view line) {
    // leading blank is already trimmed if MLSD was processed by curl
    if (!line.empty() && line.front() == ' ') line.remove_prefix(1);

    const auto blank = line.find(' ');
    if (blank == std::string_view::npos || blank + 1 >= line.size())
        throw std::invalid_argument("Item name not available: " + std::string(line));

    Entry entry;
    entry.name = std::string(line.substr(blank + 1));

    std::string_view facts = line.substr(0, blank);
    while (!facts.empty()) {
        const auto semi = facts.find(';');
        const std::string_view fact = facts.substr(0, semi);
        facts = semi == std::string_view::npos ? std::string_view{} : facts.substr(semi + 1);

        const auto eq = fact.find('=');
        if (eq == std::string_view::npos) continue;
        const auto value = fact.substr(eq + 1);

        if (startsWithNoCase(fact, "type=")) entry.type = parseType(value);
        else if (startsWithNoCase(fact, "modify=")) entry.modified = util::parseModifyTime(value);
    }

    return entry;
}

std::vector<std::string_view> splitLines(const std::string_view listing) {
    std::vector<std::string_view> lines;
    std::size_t pos = 0;
    while (pos < listing.size()) {
        auto end = listing.find('\n', pos);
        if (end == std::string_view::npos) end = listing.size();
        auto line = listing.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) lines.push_back(line);
        pos = end + 1;
    }
    return lines;
}

std::vector<types::RemoteFile> parseListing(const std::string_view listing, const types::Device& device) {
    using logging::LogRegistry;

    std::vector<types::RemoteFile> files;
    for (const auto& line : splitLines(listing)) {
        Entry entry;
        try {
            entry = parseLine(line);
        } catch (const std::invalid_argument& e) {
            LogRegistry::transport()->warn("[mlsd] Skipping unreadable listing line from {}: {}", device.name(), e.what());
            continue;
        }

        if (entry.type != EntryType::File) continue;

        if (device.isListingArtifact(entry.name)) {
            LogRegistry::transport()->debug("[mlsd] Ignoring listing artifact '{}' from {}", entry.name, device.name());
            continue;
        }

        if (!entry.modified) {
            LogRegistry::transport()->warn("[mlsd] Skipping '{}' from {}: no valid modify time", entry.name, device.name());
            continue;
        }

        files.emplace_back(std::move(entry.name), *entry.modified);
    }

    std::ranges::sort(files, {}, &types::RemoteFile::name);
    return files;
}

}
