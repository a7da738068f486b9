#ifndef SW_TRAVERSAL
#define SW_TRAVERSAL

#include <cstddef>
#include <functional>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "Frontier.hpp"
#include "LinkSource.hpp"
#include "PermissionCheck.hpp"
#include "Strategy.hpp"
#include "VisitedSet.hpp"

class TraversalAborted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TraversalStats {
    std::size_t visited { 0 };
    std::size_t fetchFailures { 0 };
    std::size_t disallowed { 0 };
    std::size_t duplicatesSkipped { 0 };
};

/*
 * Walks the same-host link graph from one start url and yields every page
 * once, in the order given by the strategy. Pages are produced lazily: a
 * page's links are only requested when the caller asks for the page after it.
 *
 * The link source and permission check are borrowed and must outlive the
 * traversal. A traversal runs once; start over with a new instance.
 */
class Traversal {
public:
    enum class State { Init, Running, Done, Failed };

    using Vclb = std::function<void(const std::string& url, std::size_t depth)>;
    using Fclb = std::function<void(const std::string& url, const std::string& error)>;
    using Dclb = std::function<void(const std::string& url)>;

    class iterator {
        Traversal* owner { nullptr };
        std::optional<std::string> current;

        void advance() {
            current = owner->next();
            if (!current) owner = nullptr;
        }

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(Traversal* traversal) : owner(traversal) { advance(); }

        reference operator*() const { return *current; }
        pointer operator->() const { return &*current; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const noexcept { return owner == other.owner; }
        bool operator!=(const iterator& other) const noexcept { return owner != other.owner; }
    };

private:
    LinkSource& source;
    const Strategy strategy_;
    const InsertionPolicy insert;
    Frontier frontier {};
    VisitedSet visited_ {};
    // Refused by the permission check; reported once, never queued again.
    VisitedSet denied {};
    State state_ { State::Init };
    TraversalStats stats_ {};

    // Emitted by the previous next() call, links not yet requested.
    std::optional<FrontierEntry> unexpanded;

    std::size_t max_pages { 0 };
    std::optional<std::size_t> max_depth;
    std::size_t max_consecutive_failures { 0 };
    std::size_t consecutive_failures { 0 };

    const PermissionCheck* permission { nullptr };
    std::string user_agent { "*" };
    std::ostream* out { &std::cerr };

    Vclb onVisitclb;
    Fclb onFetchFailureclb;
    Dclb onDisallowedclb;

    void fail(const std::string& message) {
        state_ = State::Failed;
        frontier.clear();
        *out << message << '\n';
        throw TraversalAborted(message);
    }

    void expand(const FrontierEntry& page) {
        // links past the depth limit would never be pushed, so skip the fetch
        if (max_depth && page.depth >= *max_depth) return;

        LinkResult result = source.sameHostLinks(page.url);

        if (!result.ok()) {
            ++stats_.fetchFailures;
            ++consecutive_failures;
            *out << "Fetch failure (" << result.error << "): " << page.url << '\n';
            if (onFetchFailureclb) onFetchFailureclb(page.url, result.error);
            if (max_consecutive_failures && consecutive_failures >= max_consecutive_failures)
                fail("Aborting traversal after " + std::to_string(consecutive_failures) + " consecutive fetch failures");
            return;
        }
        consecutive_failures = 0;

        for (auto& link : result.links) {
            if (!visited_.contains(link) && !denied.contains(link)) (frontier.*insert)(std::move(link), page.depth + 1);
        }
    }

    bool pageLimitReached() const noexcept {
        return max_pages && visited_.size() >= max_pages;
    }

    void finish() noexcept {
        frontier.clear();
        unexpanded.reset();
        state_ = State::Done;
    }

public:
    Traversal(LinkSource& src, std::string startUrl, const Strategy strategy = Strategy::BreadthFirst)
        : source(src), strategy_(strategy), insert(StrategySelector::insertionPolicy(strategy)) {
        (frontier.*insert)(std::move(startUrl), 0);
    }

    // Resolves the strategy name before anything else; an unknown name throws
    // UnknownStrategy and no traversal is created.
    static Traversal create(LinkSource& src, const std::string& startUrl, const std::string& strategyName) {
        return Traversal(src, startUrl, StrategySelector::resolve(strategyName));
    }

    Traversal(const Traversal&) = delete;
    Traversal& operator=(const Traversal&) = delete;
    Traversal(Traversal&&) = default;

    std::optional<std::string> next() {
        if (state_ == State::Done || state_ == State::Failed) return std::nullopt;
        state_ = State::Running;

        if (pageLimitReached()) {
            finish();
            return std::nullopt;
        }

        if (unexpanded) {
            const FrontierEntry page = std::move(*unexpanded);
            unexpanded.reset();
            expand(page);
        }

        while (auto entry = frontier.pop()) {
            if (visited_.contains(entry->url) || denied.contains(entry->url)) {
                ++stats_.duplicatesSkipped;
                continue;
            }

            if (permission && !permission->isAllowed(entry->url, user_agent)) {
                denied.mark(entry->url);
                ++stats_.disallowed;
                *out << "Disallowed by robots.txt: " << entry->url << '\n';
                if (onDisallowedclb) onDisallowedclb(entry->url);
                continue;
            }

            visited_.mark(entry->url);
            ++stats_.visited;
            if (onVisitclb) onVisitclb(entry->url, entry->depth);
            unexpanded = *entry;
            return std::move(entry->url);
        }

        finish();
        return std::nullopt;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Drains the traversal; pages are reported through onVisit.
    const TraversalStats& run() {
        while (next()) {}
        return stats_;
    }

    void setMaxPages(const std::size_t pages) noexcept { max_pages = pages; }

    void setMaxDepth(const std::size_t depth) noexcept { max_depth = depth; }

    void setMaxConsecutiveFailures(const std::size_t failures) noexcept { max_consecutive_failures = failures; }

    void setPermissionCheck(const PermissionCheck& check, const std::string& ua = "*") {
        permission = &check;
        user_agent = ua;
    }

    void setLogStream(std::ostream& stream = std::cerr) noexcept { out = &stream; }

    void onVisit(const Vclb& clb) noexcept { onVisitclb = clb; }

    void onFetchFailure(const Fclb& clb) noexcept { onFetchFailureclb = clb; }

    void onDisallowed(const Dclb& clb) noexcept { onDisallowedclb = clb; }

    State state() const noexcept { return state_; }

    Strategy strategy() const noexcept { return strategy_; }

    const TraversalStats& stats() const noexcept { return stats_; }

    std::size_t pending() const noexcept { return frontier.size(); }

    const VisitedSet& visited() const noexcept { return visited_; }
};

#endif
