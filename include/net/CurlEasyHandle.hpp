#ifndef SW_CURL_EASY
#define SW_CURL_EASY

#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

class CurlEasyHandle {
    long timeout_ms;
    std::string buf;
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_handle_;

    static inline void checkSetOpt(const CURLcode res, const char* opt_name) noexcept {
        if (res != CURLE_OK) std::cerr << "Failed to set " << opt_name << ": " << curl_easy_strerror(res) << '\n';
    }

    template<typename T>
    inline void setOption(const CURLoption option, const T value, const char* opt_name) noexcept {
        checkSetOpt(curl_easy_setopt(curl_handle_.get(), option, value), opt_name);
    }

    static std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
        const std::size_t totalSize = size * nmemb;
        static_cast<std::string*>(userdata)->append(ptr, totalSize);
        return totalSize;
    }

    void initialiseOptions() noexcept {
        setOption(CURLOPT_WRITEFUNCTION, write_callback, "CURLOPT_WRITEFUNCTION");
        setOption(CURLOPT_WRITEDATA, static_cast<void*>(&buf), "CURLOPT_WRITEDATA");
        setOption(CURLOPT_MAXFILESIZE, 2L * 1024 * 1024, "CURLOPT_MAXFILESIZE");
        setOption(CURLOPT_CONNECTTIMEOUT_MS, 6000L, "CURLOPT_CONNECTTIMEOUT_MS");
        setOption(CURLOPT_NOSIGNAL, 1L, "CURLOPT_NOSIGNAL");
        setOption(CURLOPT_ACCEPT_ENCODING, "", "CURLOPT_ACCEPT_ENCODING");
        setOption(CURLOPT_HTTPGET, 1L, "CURLOPT_HTTPGET");
        setFollowRedirects(true);
        setMaxRedirections(5);
        setTimeoutMs(timeout_ms);
        setUserAgent("SiteWalker/1.0");
        setVerify(true);
    }

public:

    explicit CurlEasyHandle(const long timeout) : timeout_ms(timeout),
        curl_handle_(curl_easy_init(), &curl_easy_cleanup)
    {
        if (!curl_handle_) throw std::runtime_error("Failed to initialize curl handle.");
        initialiseOptions();
    }

    CurlEasyHandle(const CurlEasyHandle&) = delete;
    CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;
    CurlEasyHandle(CurlEasyHandle&&) = delete;
    CurlEasyHandle& operator=(CurlEasyHandle&&) = delete;

    // Snapshot of the transfer info taken right after perform().
    struct Response {
        std::string url;
        std::string contentType;
        long responseCode { 0 };
        double totalTime { 0.0 };
        curl_off_t bytesReceived { 0 };
        const std::string& message;

        Response(CURL* handle, const std::string& body) : message(body) {
            char* tempStr = nullptr;

            if (CURLE_OK == curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &tempStr) && tempStr)
                url = tempStr;

            tempStr = nullptr;
            if (CURLE_OK == curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &tempStr) && tempStr)
                contentType = tempStr;

            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &responseCode);
            curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &totalTime);
            curl_easy_getinfo(handle, CURLINFO_SIZE_DOWNLOAD_T, &bytesReceived);
        }
    };

    void setTimeoutMs(const long tm) noexcept {
        timeout_ms = tm;
        setOption(CURLOPT_TIMEOUT_MS, tm, "CURLOPT_TIMEOUT_MS");
    }

    void setUserAgent(const std::string& ua) noexcept {
        setOption(CURLOPT_USERAGENT, ua.c_str(), "CURLOPT_USERAGENT");
    }

    void setMaxRedirections(const long l) noexcept {
        setOption(CURLOPT_MAXREDIRS, l, "CURLOPT_MAXREDIRS");
    }

    void setFollowRedirects(bool follow) noexcept {
        setOption(CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L, "CURLOPT_FOLLOWLOCATION");
    }

    void setVerify(bool verify) noexcept {
        setOption(CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L, "CURLOPT_SSL_VERIFYPEER");
        setOption(CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L, "CURLOPT_SSL_VERIFYHOST");
    }

    void setUrl(const std::string& url) noexcept {
        buf.clear();
        setOption(CURLOPT_URL, url.c_str(), "CURLOPT_URL");
    }

    const std::string& getBuffer() const noexcept {
        return buf;
    }

    CURL* get() noexcept {
        return curl_handle_.get();
    }

    long getTimeoutMs() const noexcept {
        return timeout_ms;
    }

    std::unique_ptr<Response> response() {
        return std::make_unique<Response>(get(), buf);
    }

    CURLcode perform() noexcept {
        return curl_easy_perform(curl_handle_.get());
    }
};

#endif
