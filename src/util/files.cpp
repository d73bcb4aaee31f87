#include "util/files.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace std::chrono;

namespace rs::util {

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw fs::filesystem_error("Failed to open file", path, std::make_error_code(std::errc::io_error));

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw fs::filesystem_error("Failed to read file", path, std::make_error_code(std::errc::io_error));

    return buffer;
}

void writeFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw fs::filesystem_error("Failed to open file for writing", path, std::make_error_code(std::errc::io_error));
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) throw fs::filesystem_error("Failed to write file", path, std::make_error_code(std::errc::io_error));
}

system_clock::time_point getModTime(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0)
        throw fs::filesystem_error("stat failed", path, std::error_code(errno, std::generic_category()));

    return system_clock::time_point(duration_cast<system_clock::duration>(
        seconds(st.st_mtim.tv_sec) + nanoseconds(st.st_mtim.tv_nsec)));
}

void setModTime(const fs::path& path, const system_clock::time_point tp) {
    const auto ns = duration_cast<nanoseconds>(tp.time_since_epoch()).count();

    timespec times[2];
    times[0].tv_sec = static_cast<time_t>(ns / 1'000'000'000);
    times[0].tv_nsec = static_cast<long>(ns % 1'000'000'000);
    if (times[0].tv_nsec < 0) {
        times[0].tv_sec -= 1;
        times[0].tv_nsec += 1'000'000'000;
    }
    times[1] = times[0];

    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
        throw fs::filesystem_error("utimensat failed", path, std::error_code(errno, std::generic_category()));
}

void copyPreservingModTime(const fs::path& src, const fs::path& dst) {
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    setModTime(dst, getModTime(src));
}

} // namespace rs::util
