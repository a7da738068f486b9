#include <cxxopts.hpp>

#include <iostream>
#include <string>

#include "src/SiteWalker.hpp"

int main(int argc, char** argv) {
    cxxopts::Options options("sitewalker", "Visit every page reachable from a start URL on the same host");

    options.add_options()
        ("u,url", "Start URL", cxxopts::value<std::string>())
        ("s,strategy", "depth-first or breadth-first", cxxopts::value<std::string>()->default_value("breadth-first"))
        ("m,max-pages", "Stop after this many pages (0 = no limit)", cxxopts::value<std::size_t>()->default_value("0"))
        ("d,max-depth", "Do not follow links past this depth", cxxopts::value<std::size_t>())
        ("r,robots", "Skip pages disallowed by the host's robots.txt")
        ("a,user-agent", "User agent for requests and robots.txt", cxxopts::value<std::string>()->default_value("SiteWalker/1.0"))
        ("t,timeout", "Request timeout in milliseconds", cxxopts::value<long>()->default_value("10000"))
        ("e,extractor", "pattern or dom", cxxopts::value<std::string>()->default_value("pattern"))
        ("f,max-failures", "Abort after this many consecutive fetch failures (0 = never)", cxxopts::value<std::size_t>()->default_value("0"))
        ("q,quiet", "Do not print the summary line")
        ("h,help", "Print usage");

    try {
        const auto args = options.parse(argc, argv);

        if (args.count("help")) {
            std::cout << options.help() << '\n';
            return 0;
        }
        if (!args.count("url")) {
            std::cerr << "Missing --url\n" << options.help() << '\n';
            return 1;
        }

        const std::string extractor = args["extractor"].as<std::string>();
        if (extractor != "pattern" && extractor != "dom") {
            std::cerr << "Unknown extractor: " << extractor << " (expected pattern or dom)\n";
            return 1;
        }

        SiteWalker walker(args["timeout"].as<long>());
        walker.setUserAgent(args["user-agent"].as<std::string>());
        walker.setExtractor(extractor == "dom" ? ExtractorKind::Dom : ExtractorKind::Pattern);
        walker.setRespectRobots(args.count("robots") > 0);

        Traversal traversal = walker.traverse(args["url"].as<std::string>(), args["strategy"].as<std::string>());
        traversal.setMaxPages(args["max-pages"].as<std::size_t>());
        traversal.setMaxConsecutiveFailures(args["max-failures"].as<std::size_t>());
        if (args.count("max-depth")) traversal.setMaxDepth(args["max-depth"].as<std::size_t>());

        for (const auto& url : traversal) {
            std::cout << url << '\n';
        }

        if (!args.count("quiet")) {
            const auto& stats = traversal.stats();
            std::cerr << "visited=" << stats.visited
                      << " failures=" << stats.fetchFailures
                      << " disallowed=" << stats.disallowed << '\n';
        }
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << e.what() << '\n' << options.help() << '\n';
        return 1;
    } catch (const UnknownStrategy& e) {
        std::cerr << e.what() << '\n';
        return 1;
    } catch (const TraversalAborted& e) {
        std::cerr << e.what() << '\n';
        return 2;
    } catch (const RobotsUnavailable& e) {
        std::cerr << e.what() << '\n';
        return 2;
    }
    return 0;
}
