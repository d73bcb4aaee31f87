#pragma once

#include "types/Device.hpp"
#include "types/RemoteFile.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rs::transport {

// One file-transfer connection to one device. Every operation reports
// failure by throwing a transport::Error subtype (see errors.hpp); nothing
// thrown here is meant to escape the per-device boundary of a run.
class Session {
public:
    explicit Session(types::Device device) : device_(std::move(device)) {}
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // throws ConnectError
    virtual void connect(std::chrono::seconds timeout) = 0;

    // Logs in with credentials, anonymously when none are given.
    // throws AuthError, ConnectError
    virtual void authenticate(const std::optional<types::Credentials>& credentials) = 0;

    // throws PathError
    virtual void changeDirectory(const std::string& path) = 0;

    // Files in the current directory with their modify-times.
    // throws TransferError
    [[nodiscard]] virtual std::vector<types::RemoteFile> list() = 0;

    // Fetches into dest and stamps dest with the remote modify-time.
    // throws TransferError, std::filesystem::filesystem_error
    void download(const types::RemoteFile& file, const std::filesystem::path& dest);

    // throws TransferError
    virtual void upload(const std::filesystem::path& local, const std::string& remoteName) = 0;

    // Best-effort and idempotent.
    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;

    [[nodiscard]] const types::Device& device() const { return device_; }

protected:
    virtual void fetch(const std::string& remoteName, const std::filesystem::path& dest) = 0;

    types::Device device_;
};

using SessionFactory = std::function<std::unique_ptr<Session>(const types::Device&)>;

}
