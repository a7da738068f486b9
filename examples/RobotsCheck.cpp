#include <iostream>

#include "../include/net/RobotsPolicy.hpp"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: robots_check <robots_url> <url>... [--agent <name>]\n";
        return 1;
    }

    std::string agent = "*";
    std::vector<std::string> urls;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--agent" && i + 1 < argc) agent = argv[++i];
        else urls.emplace_back(arg);
    }

    CurlPageFetcher fetcher;
    fetcher.setUserAgent(agent == "*" ? "SiteWalker/1.0" : agent);
    try {
        const RobotsPolicy policy = RobotsPolicy::prepare(argv[1], fetcher);
        for (const auto& url : urls) {
            std::cout << url << ' ' << (policy.isAllowed(url, agent) ? "allowed" : "disallowed") << '\n';
        }
    } catch (const RobotsUnavailable& e) {
        std::cerr << e.what() << '\n';
        return 2;
    }
    return 0;
}
