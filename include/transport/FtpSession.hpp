#pragma once

#include "transport/Session.hpp"
#include "transport/curlWrappers.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rs::transport {

// Session over FTP using one libcurl easy handle. The handle keeps the
// control connection alive between calls, so a session retained after the
// download phase uploads without logging in again.
class FtpSession final : public Session {
public:
    explicit FtpSession(types::Device device);
    ~FtpSession() override;

    void connect(std::chrono::seconds timeout) override;
    void authenticate(const std::optional<types::Credentials>& credentials) override;
    void changeDirectory(const std::string& path) override;
    [[nodiscard]] std::vector<types::RemoteFile> list() override;
    void upload(const std::filesystem::path& local, const std::string& remoteName) override;
    void close() noexcept override;
    [[nodiscard]] bool isOpen() const override { return static_cast<bool>(curl_); }

    static SessionFactory factory();

protected:
    void fetch(const std::string& remoteName, const std::filesystem::path& dest) override;

private:
    std::unique_ptr<CurlEasy> curl_;
    std::chrono::seconds timeout_{10};
    std::string dirUrl_;                  // ends with '/'
    std::string headerData_;
    char errorBuf_[CURL_ERROR_SIZE]{};

    [[nodiscard]] std::string rootUrl() const;
    [[nodiscard]] std::string dirUrlFor(const std::string& path);
    [[nodiscard]] std::string fileUrl(const std::string& name);

    CURL* handle();

    // Resets per-request options, applies setup and runs the request.
    CURLcode perform(const std::string& url, const std::function<void(CURL*)>& setup);

    [[nodiscard]] std::string describe(CURLcode rc) const;
    [[noreturn]] void throwConnectError(CURLcode rc);
};

}
