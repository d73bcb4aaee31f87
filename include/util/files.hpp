#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace rs::util {

std::string readFileToString(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& contents);

// Modification times go through stat/utimensat so they round-trip exactly
// between download, reconciliation and publish.
std::chrono::system_clock::time_point getModTime(const std::filesystem::path& path);
void setModTime(const std::filesystem::path& path, std::chrono::system_clock::time_point tp);

// Copies src over dst and gives dst the mtime of src.
void copyPreservingModTime(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace rs::util
