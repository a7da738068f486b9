#ifndef SW_PAGE_FETCHER
#define SW_PAGE_FETCHER

#include <stdexcept>
#include <string>
#include <utility>

#include "CurlEasyHandle.hpp"

struct FetchResult {
    bool ok { false };
    long statusCode { 0 };
    std::string effectiveUrl;
    std::string contentType;
    std::string body;
    std::string error;

    static FetchResult success(std::string url, long code, std::string type, std::string content) {
        FetchResult r;
        r.ok = true;
        r.statusCode = code;
        r.effectiveUrl = std::move(url);
        r.contentType = std::move(type);
        r.body = std::move(content);
        return r;
    }

    static FetchResult failure(std::string message, long code = 0) {
        FetchResult r;
        r.statusCode = code;
        r.error = std::move(message);
        return r;
    }
};

class PageFetcher {
public:
    virtual ~PageFetcher() = default;
    virtual FetchResult fetch(const std::string& url) = 0;
};

// Blocking GET over one reused easy handle.
class CurlPageFetcher final : public PageFetcher {
    // Declared before the handle so global cleanup runs after curl_easy_cleanup.
    struct CurlGlobal {
        CurlGlobal() {
            if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
                throw std::runtime_error("Failed to initialize libcurl");
        }
        ~CurlGlobal() { curl_global_cleanup(); }
    } global;
    CurlEasyHandle handle;

public:
    explicit CurlPageFetcher(const long timeout_ms = 10000) : handle(timeout_ms) {}

    CurlPageFetcher(const CurlPageFetcher&) = delete;
    CurlPageFetcher& operator=(const CurlPageFetcher&) = delete;

    void setUserAgent(const std::string& ua) noexcept { handle.setUserAgent(ua); }
    void setTimeoutMs(const long tm) noexcept { handle.setTimeoutMs(tm); }
    void setMaxRedirections(const long l) noexcept { handle.setMaxRedirections(l); }
    void setVerify(bool verify) noexcept { handle.setVerify(verify); }

    FetchResult fetch(const std::string& url) override {
        handle.setUrl(url);
        const CURLcode res = handle.perform();
        if (res != CURLE_OK)
            return FetchResult::failure(curl_easy_strerror(res));

        auto response = handle.response();
        if (response->responseCode < 200 || response->responseCode >= 300)
            return FetchResult::failure("HTTP status " + std::to_string(response->responseCode), response->responseCode);

        std::string effective = response->url.empty() ? url : response->url;
        return FetchResult::success(std::move(effective), response->responseCode, response->contentType, response->message);
    }
};

#endif
