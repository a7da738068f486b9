#include <iostream>

#include "../src/SiteWalker.hpp"

// Prints every <img> source on one page, resolved against the page URL.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: image_locations <url> [dom]\n";
        return 1;
    }
    const std::string url = argv[1];

    SiteWalker walker;
    if (argc > 2 && std::string(argv[2]) == "dom") walker.setExtractor(ExtractorKind::Dom);

    FetchResult page = walker.pageFetcher().fetch(url);
    if (!page.ok) {
        std::cerr << "Fetch failure (" << page.error << "): " << url << '\n';
        return 2;
    }

    for (const auto& src : walker.hrefExtractor().extractImageSources(page.body)) {
        if (auto resolved = UrlResolver::resolve(page.effectiveUrl, src)) std::cout << *resolved << '\n';
        else std::cerr << "Skipping malformed image reference: " << src << '\n';
    }
    return 0;
}
