#ifndef SW_HTTP_LINK_SOURCE
#define SW_HTTP_LINK_SOURCE

#include <exception>
#include <string>
#include <vector>

#include "../crawl/LinkSource.hpp"
#include "../parser/LinkExtractor.hpp"
#include "PageFetcher.hpp"
#include "UrlResolver.hpp"

// Fetch, extract, resolve against the fetched page, keep same-host links.
class HttpLinkSource final : public LinkSource {
    PageFetcher& fetcher;
    const HrefExtractor* extractor;
    std::size_t dropped { 0 };

public:
    HttpLinkSource(PageFetcher& f, const HrefExtractor& e) : fetcher(f), extractor(&e) {}

    // Later calls to sameHostLinks use `e`; traversals holding this source
    // keep working.
    void setExtractor(const HrefExtractor& e) noexcept { extractor = &e; }

    const HrefExtractor& hrefExtractor() const noexcept { return *extractor; }

    LinkResult sameHostLinks(const std::string& url) override {
        const auto origin = UrlResolver::host(url);
        if (!origin) return LinkResult::failure("malformed URL");

        FetchResult page = fetcher.fetch(url);
        if (!page.ok) return LinkResult::failure(page.error);

        std::vector<std::string> hrefs;
        try {
            hrefs = extractor->extractHrefs(page.body);
        } catch (const std::exception& e) {
            return LinkResult::failure(std::string("extraction failed: ") + e.what());
        }

        const std::string& base = page.effectiveUrl.empty() ? url : page.effectiveUrl;
        std::vector<std::string> links;
        links.reserve(hrefs.size());
        for (const auto& href : hrefs) {
            auto resolved = UrlResolver::resolve(base, href);
            if (!resolved) {
                ++dropped;
                continue;
            }
            if (UrlResolver::host(*resolved) == origin) links.emplace_back(std::move(*resolved));
        }
        return LinkResult::success(std::move(links));
    }

    // References that could not be resolved to a URL so far.
    std::size_t droppedReferences() const noexcept { return dropped; }
};

#endif
