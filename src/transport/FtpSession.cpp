#include "transport/FtpSession.hpp"
#include "transport/errors.hpp"
#include "transport/mlsd.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>

using namespace rs::transport;
using namespace rs::logging;
using namespace rs::types;

namespace {

constexpr auto discardBytes = +[](char*, const size_t size, const size_t nmemb, void*) -> size_t {
    return size * nmemb;
};

constexpr auto appendToString = +[](char* p, const size_t size, const size_t nmemb, void* ud) -> size_t {
    static_cast<std::string*>(ud)->append(p, size * nmemb);
    return size * nmemb;
};

ConnectError::Kind classify(CURL* h, const CURLcode rc) {
    switch (rc) {
    case CURLE_COULDNT_RESOLVE_HOST: return ConnectError::Kind::Unreachable;
    case CURLE_OPERATION_TIMEDOUT: return ConnectError::Kind::TimedOut;
    case CURLE_COULDNT_CONNECT: {
        long osErrno = 0;
        if (curl_easy_getinfo(h, CURLINFO_OS_ERRNO, &osErrno) == CURLE_OK) {
            if (osErrno == EHOSTUNREACH || osErrno == ENETUNREACH) return ConnectError::Kind::Unreachable;
            if (osErrno == ETIMEDOUT) return ConnectError::Kind::TimedOut;
        }
        return ConnectError::Kind::Refused;
    }
    default: return ConnectError::Kind::Other;
    }
}

std::string lastServerResponse(const std::string& headerData) {
    const auto lines = mlsd::splitLines(headerData);
    return lines.empty() ? std::string{} : std::string(lines.back());
}

}

FtpSession::FtpSession(Device device) : Session(std::move(device)) {}

FtpSession::~FtpSession() { close(); }

SessionFactory FtpSession::factory() {
    return [](const Device& device) -> std::unique_ptr<Session> {
        return std::make_unique<FtpSession>(device);
    };
}

void FtpSession::connect(const std::chrono::seconds timeout) {
    ensureCurlGlobalInit();
    timeout_ = timeout;

    // libcurl cannot open an FTP control connection without logging in, so
    // reachability is probed on a throwaway handle: any reply to the
    // anonymous login, a rejection included, proves the server is there.
    {
        CurlEasy probe;
        curl_easy_setopt(probe, CURLOPT_URL, rootUrl().c_str());
        curl_easy_setopt(probe, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
        curl_easy_setopt(probe, CURLOPT_CONNECT_ONLY, 1L);

        const CURLcode rc = curl_easy_perform(probe);
        if (rc != CURLE_OK && rc != CURLE_LOGIN_DENIED) {
            const auto kind = classify(probe, rc);
            throw ConnectError(kind, fmt::format("Connection to {} at {} {}: {}",
                device_.name(), device_.endpoint(), to_string(kind), curl_easy_strerror(rc)));
        }
    }

    curl_ = std::make_unique<CurlEasy>();
    CURL* h = *curl_;
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errorBuf_);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, appendToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &headerData_);
    dirUrl_ = rootUrl();

    LogRegistry::transport()->debug("[FtpSession] {} reachable at {}", device_.name(), device_.endpoint());
}

void FtpSession::authenticate(const std::optional<Credentials>& credentials) {
    CURL* h = handle();

    if (credentials) {
        curl_easy_setopt(h, CURLOPT_USERNAME, credentials->username.c_str());
        curl_easy_setopt(h, CURLOPT_PASSWORD, credentials->password.c_str());
    } else {
        curl_easy_setopt(h, CURLOPT_USERNAME, nullptr);
        curl_easy_setopt(h, CURLOPT_PASSWORD, nullptr);
    }

    const CURLcode rc = perform(rootUrl(), [](CURL* c) { curl_easy_setopt(c, CURLOPT_NOBODY, 1L); });

    if (rc == CURLE_LOGIN_DENIED)
        throw AuthError(fmt::format("Login to {} as {} rejected: {}", device_.name(),
            credentials ? credentials->username : std::string("anonymous"), describe(rc)));

    if (rc != CURLE_OK) throwConnectError(rc);

    LogRegistry::transport()->debug("[FtpSession] Logged in to {} {}", device_.name(),
                                    credentials ? "as " + credentials->username : std::string("anonymously"));
}

void FtpSession::changeDirectory(const std::string& path) {
    const auto url = dirUrlFor(path);
    const CURLcode rc = perform(url, [](CURL* c) { curl_easy_setopt(c, CURLOPT_NOBODY, 1L); });

    if (rc == CURLE_REMOTE_ACCESS_DENIED || rc == CURLE_REMOTE_FILE_NOT_FOUND)
        throw PathError(fmt::format("Could not move to '{}' on {}: {}", path, device_.name(), describe(rc)));

    if (rc != CURLE_OK)
        throw TransferError(fmt::format("Changing directory to '{}' on {} failed: {}", path, device_.name(), describe(rc)));

    dirUrl_ = url;
}

std::vector<RemoteFile> FtpSession::list() {
    std::string rawListing;

    const CURLcode rc = perform(dirUrl_, [&](CURL* c) {
        curl_easy_setopt(c, CURLOPT_CUSTOMREQUEST, "MLSD");
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, appendToString);
        curl_easy_setopt(c, CURLOPT_WRITEDATA, &rawListing);
    });

    if (rc != CURLE_OK)
        throw TransferError(fmt::format("MLSD on {} failed (does the server support MLSD?): {}",
                                        device_.name(), describe(rc)));

    return mlsd::parseListing(rawListing, device_);
}

void FtpSession::fetch(const std::string& remoteName, const std::filesystem::path& dest) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) throw std::filesystem::filesystem_error("Failed to open download target", dest,
                                                      std::make_error_code(std::errc::io_error));

    const CURLcode rc = perform(fileUrl(remoteName), [&](CURL* c) {
        curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, +[](char* p, const size_t size, const size_t nmemb, void* ud) -> size_t {
            auto* fout = static_cast<std::ofstream*>(ud);
            fout->write(p, static_cast<std::streamsize>(size * nmemb));
            return fout->good() ? size * nmemb : 0;
        });
        curl_easy_setopt(c, CURLOPT_WRITEDATA, &out);
    });

    out.close();

    if (!out) {
        // disk full or local I/O error, fatal for the whole run
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        throw std::filesystem::filesystem_error("Failed to write download target", dest,
                                                std::make_error_code(std::errc::io_error));
    }

    if (rc != CURLE_OK) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        throw TransferError(fmt::format("Download of '{}' from {} failed: {}", remoteName, device_.name(), describe(rc)));
    }
}

void FtpSession::upload(const std::filesystem::path& local, const std::string& remoteName) {
    std::ifstream fin(local, std::ios::binary | std::ios::ate);
    if (!fin) throw TransferError("Failed to open file for upload: " + local.string());

    const curl_off_t sz = fin.tellg();
    fin.seekg(0);

    const CURLcode rc = perform(fileUrl(remoteName), [&](CURL* c) {
        curl_easy_setopt(c, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(c, CURLOPT_INFILESIZE_LARGE, sz);
        curl_easy_setopt(c, CURLOPT_READDATA, &fin);
        curl_easy_setopt(c, CURLOPT_READFUNCTION,
            +[](char* buf, const size_t size, const size_t nmemb, void* ud) -> size_t {
                auto* fp = static_cast<std::ifstream*>(ud);
                fp->read(buf, static_cast<std::streamsize>(size * nmemb));
                if (fp->bad()) return CURL_READFUNC_ABORT;
                return static_cast<size_t>(fp->gcount());
            });
    });

    if (rc != CURLE_OK)
        throw TransferError(fmt::format("Upload of '{}' to {} failed: {}", remoteName, device_.name(), describe(rc)));
}

void FtpSession::close() noexcept {
    if (!curl_) return;
    curl_.reset(); // curl_easy_cleanup sends QUIT on the live control connection
}

std::string FtpSession::rootUrl() const {
    const auto& host = device_.hostname();
    const bool ipv6 = host.find(':') != std::string::npos && host.front() != '[';
    return fmt::format("ftp://{}{}{}:{}/", ipv6 ? "[" : "", host, ipv6 ? "]" : "", device_.port());
}

std::string FtpSession::dirUrlFor(const std::string& path) {
    CURL* h = handle();
    std::string url = rootUrl();

    // a leading '/' is absolute on the server, everything else is relative to the login directory
    if (path.starts_with('/')) url += "%2F";

    std::string_view rest = path;
    while (!rest.empty()) {
        const auto slash = rest.find('/');
        const auto segment = rest.substr(0, slash);
        rest = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash + 1);
        if (segment.empty()) continue;

        if (!url.ends_with('/')) url += '/';
        url += escapeSegment(h, std::string(segment));
    }

    if (!url.ends_with('/')) url += '/';
    return url;
}

std::string FtpSession::fileUrl(const std::string& name) {
    return dirUrl_ + escapeSegment(handle(), name);
}

CURL* FtpSession::handle() {
    if (!curl_) throw ConnectError(ConnectError::Kind::Other,
                                   fmt::format("Session to {} is not connected", device_.name()));
    return *curl_;
}

CURLcode FtpSession::perform(const std::string& url, const std::function<void(CURL*)>& setup) {
    CURL* h = handle();

    curl_easy_setopt(h, CURLOPT_NOBODY, 0L);
    curl_easy_setopt(h, CURLOPT_UPLOAD, 0L);
    curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, nullptr);
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(-1));
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discardBytes);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, nullptr);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, nullptr);
    curl_easy_setopt(h, CURLOPT_READDATA, nullptr);

    headerData_.clear();
    errorBuf_[0] = '\0';

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    setup(h);

    return curl_easy_perform(h);
}

std::string FtpSession::describe(const CURLcode rc) const {
    std::string msg = errorBuf_[0] != '\0' ? std::string(errorBuf_) : std::string(curl_easy_strerror(rc));
    if (const auto response = lastServerResponse(headerData_); !response.empty())
        msg += fmt::format(" (server: {})", response);
    return msg;
}

void FtpSession::throwConnectError(const CURLcode rc) {
    const auto kind = classify(handle(), rc);
    throw ConnectError(kind, fmt::format("Connection to {} at {} {}: {}",
        device_.name(), device_.endpoint(), to_string(kind), describe(rc)));
}
