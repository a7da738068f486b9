#ifndef SW_DOM_EXTRACTOR
#define SW_DOM_EXTRACTOR

#include "LinkExtractor.hpp"
#include "Parser.hpp"

// Tree-based alternative to PatternExtractor: attribute values come from the
// parsed DOM, so quoting style and attribute order do not matter.
class DomExtractor final : public HrefExtractor {
    mutable Parser parser {};

    std::vector<std::string> collect(const std::string& html, const std::string& tag, const std::string& attr) const {
        Document dom = parser.createDOM(html);
        return dom.body()->collectAttribute(tag, attr);
    }

public:
    std::vector<std::string> extractHrefs(const std::string& html) const override {
        return collect(html, "a", "href");
    }

    std::vector<std::string> extractImageSources(const std::string& html) const override {
        return collect(html, "img", "src");
    }
};

#endif
