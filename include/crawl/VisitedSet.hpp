#ifndef SW_VISITED_SET
#define SW_VISITED_SET

#include <string>
#include <unordered_set>

class VisitedSet {
    std::unordered_set<std::string> visited_urls;

public:
    VisitedSet() = default;
    VisitedSet(const VisitedSet&) = delete;
    VisitedSet& operator=(const VisitedSet&) = delete;
    VisitedSet(VisitedSet&&) = default;
    VisitedSet& operator=(VisitedSet&&) = default;

    bool contains(const std::string& url) const {
        return visited_urls.find(url) != visited_urls.end();
    }

    // Returns false when the url was already recorded.
    bool mark(const std::string& url) {
        return visited_urls.insert(url).second;
    }

    std::size_t size() const noexcept {
        return visited_urls.size();
    }

    const std::unordered_set<std::string>& urls() const noexcept {
        return visited_urls;
    }
};

#endif
