#ifndef SW_SITEWALKER
#define SW_SITEWALKER

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "../include/crawl/Frontier.hpp"
#include "../include/crawl/LinkSource.hpp"
#include "../include/crawl/Strategy.hpp"
#include "../include/crawl/Traversal.hpp"
#include "../include/crawl/VisitedSet.hpp"

#include "../include/net/HttpLinkSource.hpp"
#include "../include/net/PageFetcher.hpp"
#include "../include/net/RobotsPolicy.hpp"
#include "../include/net/UrlResolver.hpp"

#include "../include/parser/DomExtractor.hpp"
#include "../include/parser/LinkExtractor.hpp"

enum class ExtractorKind { Pattern, Dom };

// Owns the HTTP side (fetcher, extractor, link source, robots policy) and
// hands out traversals wired to it. Must outlive every traversal it creates.
class SiteWalker {
    long timeout;
    std::string user_agent { "SiteWalker/1.0" };
    bool respect_robots { false };
    std::ostream* out { &std::cerr };

    CurlPageFetcher fetcher;
    std::unique_ptr<HrefExtractor> extractor { std::make_unique<PatternExtractor>() };
    HttpLinkSource link_source { fetcher, *extractor };
    std::optional<RobotsPolicy> robots;

public:
    explicit SiteWalker(const long timeout_ms = 10000) : timeout(timeout_ms), fetcher(timeout_ms) {
        fetcher.setUserAgent(user_agent);
    }

    SiteWalker(const SiteWalker&) = delete;
    SiteWalker& operator=(const SiteWalker&) = delete;

    void setUserAgent(const std::string& ua) {
        user_agent = ua;
        fetcher.setUserAgent(ua);
    }

    void setTimeoutMs(const long tm) noexcept {
        timeout = tm;
        fetcher.setTimeoutMs(tm);
    }

    void setVerify(bool verify) noexcept {
        fetcher.setVerify(verify);
    }

    // Takes effect for the next page fetched by any traversal, including
    // ones already handed out.
    void setExtractor(const ExtractorKind kind) {
        std::unique_ptr<HrefExtractor> next;
        if (kind == ExtractorKind::Dom) next = std::make_unique<DomExtractor>();
        else next = std::make_unique<PatternExtractor>();
        link_source.setExtractor(*next);
        extractor = std::move(next);
    }

    void setRespectRobots(bool val) noexcept {
        respect_robots = val;
    }

    void setLogStream(std::ostream& stream = std::cerr) noexcept {
        out = &stream;
    }

    // Builds a traversal from startUrl. The strategy name is resolved first,
    // so an unknown name throws before robots.txt is fetched.
    Traversal traverse(const std::string& startUrl, const std::string& strategyName = "breadth-first") {
        const Strategy strategy = StrategySelector::resolve(strategyName);

        Traversal traversal(link_source, startUrl, strategy);
        traversal.setLogStream(*out);

        if (respect_robots) {
            const auto robotsUrl = UrlResolver::robotsUrlFor(startUrl);
            if (!robotsUrl) throw RobotsUnavailable("Cannot derive robots.txt location from " + startUrl);
            robots = RobotsPolicy::prepare(*robotsUrl, fetcher);
            traversal.setPermissionCheck(*robots, user_agent);
        }
        return traversal;
    }

    PageFetcher& pageFetcher() noexcept { return fetcher; }

    const HrefExtractor& hrefExtractor() const noexcept { return *extractor; }

    const HttpLinkSource& linkSource() const noexcept { return link_source; }

    std::size_t droppedReferences() const noexcept { return link_source.droppedReferences(); }

    const std::string& userAgent() const noexcept { return user_agent; }

    long timeoutMs() const noexcept { return timeout; }
};

#endif
