#ifndef SW_URL_RESOLVER
#define SW_URL_RESOLVER

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <string>

// URL handling on top of the libcurl URL API. Every operation returns an
// empty optional when the input cannot be parsed; nothing here throws.
class UrlResolver {
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    static UrlHandle parse(const std::string& url) {
        UrlHandle h(curl_url(), &curl_url_cleanup);
        if (!h || curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
            return UrlHandle(nullptr, &curl_url_cleanup);
        return h;
    }

    static std::optional<std::string> getPart(CURLU* h, const CURLUPart part) {
        char* out = nullptr;
        if (curl_url_get(h, part, &out, 0) != CURLUE_OK || !out) return std::nullopt;
        std::string value(out);
        curl_free(out);
        return value;
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

public:
    // Resolves `reference` against `base`. An absolute reference replaces the
    // base entirely; an empty reference yields the base itself.
    static std::optional<std::string> resolve(const std::string& base, const std::string& reference) {
        auto h = parse(base);
        if (!h) return std::nullopt;
        if (!reference.empty() && curl_url_set(h.get(), CURLUPART_URL, reference.c_str(), 0) != CURLUE_OK)
            return std::nullopt;
        return getPart(h.get(), CURLUPART_URL);
    }

    // Lower-cased host component, without port.
    static std::optional<std::string> host(const std::string& url) {
        auto h = parse(url);
        if (!h) return std::nullopt;
        auto value = getPart(h.get(), CURLUPART_HOST);
        if (!value || value->empty()) return std::nullopt;
        return lower(*value);
    }

    static bool sameHost(const std::string& a, const std::string& b) {
        const auto ha = host(a);
        return ha && ha == host(b);
    }

    // Path plus "?query" when present; "/" for an empty path.
    static std::optional<std::string> pathAndQuery(const std::string& url) {
        auto h = parse(url);
        if (!h) return std::nullopt;
        std::string result = getPart(h.get(), CURLUPART_PATH).value_or("/");
        if (result.empty()) result = "/";
        if (auto query = getPart(h.get(), CURLUPART_QUERY); query && !query->empty())
            result += "?" + *query;
        return result;
    }

    // Decodes %XX escapes, then escapes every byte outside the unreserved set
    // except '/'. Two spellings of the same path compare equal afterwards.
    static std::optional<std::string> canonicalPath(const std::string& path) {
        int length = 0;
        char* raw = curl_easy_unescape(nullptr, path.c_str(), static_cast<int>(path.size()), &length);
        if (!raw) return std::nullopt;
        const std::string decoded(raw, static_cast<std::size_t>(length));
        curl_free(raw);

        std::string result;
        std::size_t start = 0;
        while (true) {
            const auto slash = decoded.find('/', start);
            const std::string segment = decoded.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
            if (!segment.empty()) {
                char* escaped = curl_easy_escape(nullptr, segment.data(), static_cast<int>(segment.size()));
                if (!escaped) return std::nullopt;
                result += escaped;
                curl_free(escaped);
            }
            if (slash == std::string::npos) break;
            result += '/';
            start = slash + 1;
        }
        return result;
    }

    static std::optional<std::string> robotsUrlFor(const std::string& url) {
        auto h = parse(url);
        if (!h) return std::nullopt;
        if (curl_url_set(h.get(), CURLUPART_PATH, "/robots.txt", 0) != CURLUE_OK) return std::nullopt;
        for (const CURLUPart part : { CURLUPART_QUERY, CURLUPART_FRAGMENT, CURLUPART_USER, CURLUPART_PASSWORD }) {
            if (curl_url_set(h.get(), part, nullptr, 0) != CURLUE_OK) return std::nullopt;
        }
        return getPart(h.get(), CURLUPART_URL);
    }
};

#endif
