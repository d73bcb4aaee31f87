#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace rs::util {

// FTP "modify" fact: YYYYMMDDHHMMSS in UTC, some daemons append ".000"
inline std::optional<std::chrono::sys_seconds> parseModifyTime(std::string_view fact) {
    if (const auto dot = fact.find('.'); dot != std::string_view::npos) fact = fact.substr(0, dot);

    if (fact.size() != 14) return std::nullopt;
    if (!std::ranges::all_of(fact, [](const unsigned char c) { return std::isdigit(c) != 0; })) return std::nullopt;

    std::tm tm = {};
    std::istringstream ss{std::string(fact)};
    ss >> std::get_time(&tm, "%Y%m%d%H%M%S");
    if (ss.fail()) return std::nullopt;

    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::from_time_t(t));
}

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// Backup set directory name; lexical order equals chronological order
inline std::string backupSetStamp(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    char buffer[20];
    strftime(buffer, sizeof(buffer), "%Y.%m.%d %H-%M-%S", &tm);
    return {buffer};
}

} // namespace rs::util
