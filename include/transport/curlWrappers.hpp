#pragma once

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>
#include <string>

namespace rs::transport {

class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h_, CURLOPT_TCP_KEEPALIVE, 1L);
    }
    ~CurlEasy() { if (h_) curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*()       { return h_; }
    operator const CURL*() const { return h_; }

private:
    CURL* h_;
};

// curl_global_init is not thread-safe; call once before the first handle.
inline void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

inline std::string escapeSegment(CURL* h, const std::string& segment) {
    char* escaped = curl_easy_escape(h, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) throw std::runtime_error("curl_easy_escape failed for: " + segment);
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}
