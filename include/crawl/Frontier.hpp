#ifndef SW_FRONTIER
#define SW_FRONTIER

#include <deque>
#include <optional>
#include <string>
#include <utility>

struct FrontierEntry {
    std::string url;
    std::size_t depth { 0 };
};

// Pending urls. Entries leave from the back: depth-first pushes land there
// and come out next, breadth-first pushes go to the front and wait for
// everything already queued.
class Frontier {
    std::deque<FrontierEntry> url_queue;

public:
    Frontier() = default;
    Frontier(const Frontier&) = delete;
    Frontier& operator=(const Frontier&) = delete;
    Frontier(Frontier&&) = default;
    Frontier& operator=(Frontier&&) = default;

    void pushDepthFirst(std::string url, std::size_t depth = 0) {
        url_queue.push_back(FrontierEntry { std::move(url), depth });
    }

    void pushBreadthFirst(std::string url, std::size_t depth = 0) {
        url_queue.push_front(FrontierEntry { std::move(url), depth });
    }

    std::optional<FrontierEntry> pop() {
        if (url_queue.empty()) return std::nullopt;
        FrontierEntry entry = std::move(url_queue.back());
        url_queue.pop_back();
        return entry;
    }

    bool isEmpty() const noexcept { return url_queue.empty(); }

    std::size_t size() const noexcept { return url_queue.size(); }

    void clear() noexcept { url_queue.clear(); }
};

#endif
