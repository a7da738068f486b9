#ifndef SW_ROBOTS_POLICY
#define SW_ROBOTS_POLICY

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../crawl/PermissionCheck.hpp"
#include "PageFetcher.hpp"
#include "UrlResolver.hpp"

class RobotsUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
 * Parsed robots.txt for one host. Build it once with prepare() or parse() and
 * hand it by reference to whatever needs permission checks.
 *
 * Records are matched in file order: the first record naming a token that
 * occurs in the user agent's product name wins, the "*" record is the
 * fallback. Inside a record the first rule whose path prefixes the url's
 * path+query decides. Rule paths and targets are compared in the form
 * UrlResolver::canonicalPath gives them, so %7E and ~ are the same byte.
 */
class RobotsPolicy final : public PermissionCheck {
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::string trim(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    struct Rule {
        std::string path;
        bool allowance;

        Rule(std::string p, bool allow) : path(std::move(p)), allowance(allow) {
            // "Disallow:" with no path allows everything
            if (path.empty() && !allowance) allowance = true;
            if (path != "*") path = UrlResolver::canonicalPath(path).value_or(path);
        }

        bool appliesTo(const std::string& target) const {
            return path == "*" || target.compare(0, path.size(), path) == 0;
        }
    };

    struct Record {
        std::vector<std::string> agents;
        std::vector<Rule> rules;

        bool isDefault() const {
            return std::find(agents.begin(), agents.end(), "*") != agents.end();
        }

        bool appliesTo(const std::string& userAgent) const {
            const std::string product = lower(userAgent.substr(0, userAgent.find('/')));
            for (const auto& agent : agents) {
                if (agent == "*") return true;
                if (product.find(lower(agent)) != std::string::npos) return true;
            }
            return false;
        }

        bool allowance(const std::string& target) const {
            for (const auto& rule : rules) {
                if (rule.appliesTo(target)) return rule.allowance;
            }
            return true;
        }
    };

    enum class Mode { Rules, AllowAll, DisallowAll };

    Mode mode { Mode::Rules };
    std::vector<Record> records;
    std::optional<Record> default_record;

    void addRecord(Record&& record) {
        if (record.isDefault()) {
            if (!default_record) default_record = std::move(record);
        } else {
            records.emplace_back(std::move(record));
        }
    }

    explicit RobotsPolicy(const Mode m) : mode(m) {}

public:
    RobotsPolicy() = default;

    static RobotsPolicy allowAll() { return RobotsPolicy(Mode::AllowAll); }

    static RobotsPolicy disallowAll() { return RobotsPolicy(Mode::DisallowAll); }

    static RobotsPolicy parse(const std::string& content) {
        RobotsPolicy policy;
        Record record;
        // 0: nothing seen, 1: user-agent lines seen, 2: rules seen
        int state = 0;

        std::istringstream lines(content);
        std::string line;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();

            if (line.empty()) {
                if (state == 1) {
                    record = Record();
                    state = 0;
                } else if (state == 2) {
                    policy.addRecord(std::move(record));
                    record = Record();
                    state = 0;
                }
            }

            if (const auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
            line = trim(line);
            if (line.empty()) continue;

            const auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            const std::string key = lower(trim(line.substr(0, colon)));
            std::string value = trim(line.substr(colon + 1));

            if (key == "user-agent") {
                if (state == 2) {
                    policy.addRecord(std::move(record));
                    record = Record();
                }
                record.agents.emplace_back(std::move(value));
                state = 1;
            } else if (key == "disallow" || key == "allow") {
                if (state != 0) {
                    record.rules.emplace_back(std::move(value), key == "allow");
                    state = 2;
                }
            }
        }
        if (state == 2) policy.addRecord(std::move(record));
        return policy;
    }

    // Fetches robotsUrl once. 401/403 deny everything, any other 4xx allows
    // everything, other error statuses deny everything. A transport failure
    // throws RobotsUnavailable.
    static RobotsPolicy prepare(const std::string& robotsUrl, PageFetcher& fetcher) {
        FetchResult result = fetcher.fetch(robotsUrl);
        if (result.ok) return parse(result.body);

        const long code = result.statusCode;
        if (code == 0) throw RobotsUnavailable("Failed to fetch " + robotsUrl + ": " + result.error);
        if (code == 401 || code == 403) return disallowAll();
        if (code >= 400 && code < 500) return allowAll();
        return disallowAll();
    }

    bool isAllowed(const std::string& url, const std::string& userAgent = "*") const override {
        if (mode == Mode::DisallowAll) return false;
        if (mode == Mode::AllowAll) return true;

        const auto raw = UrlResolver::pathAndQuery(url);
        if (!raw) return false;
        const auto target = UrlResolver::canonicalPath(*raw);
        if (!target) return false;

        for (const auto& record : records) {
            if (record.appliesTo(userAgent)) return record.allowance(*target);
        }
        if (default_record) return default_record->allowance(*target);
        return true;
    }

    std::size_t recordCount() const noexcept {
        return records.size() + (default_record ? 1 : 0);
    }
};

#endif
