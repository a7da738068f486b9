#ifndef SW_LINK_SOURCE
#define SW_LINK_SOURCE

#include <string>
#include <utility>
#include <vector>

// Outcome of expanding one page. A failed fetch is reported as such instead
// of being folded into an empty link list.
struct LinkResult {
    enum class Status { Ok, FetchFailed };

    Status status { Status::Ok };
    std::vector<std::string> links;
    std::string error;

    static LinkResult success(std::vector<std::string> found) {
        LinkResult r;
        r.links = std::move(found);
        return r;
    }

    static LinkResult failure(std::string message) {
        LinkResult r;
        r.status = Status::FetchFailed;
        r.error = std::move(message);
        return r;
    }

    bool ok() const noexcept { return status == Status::Ok; }
};

class LinkSource {
public:
    virtual ~LinkSource() = default;
    virtual LinkResult sameHostLinks(const std::string& url) = 0;
};

#endif
