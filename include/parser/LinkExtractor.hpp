#ifndef SW_LINK_EXTRACTOR
#define SW_LINK_EXTRACTOR

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class HrefExtractor {
public:
    virtual ~HrefExtractor() = default;

    // Raw href values of <a> tags, in document order.
    virtual std::vector<std::string> extractHrefs(const std::string& html) const = 0;

    // Raw src values of <img> tags, in document order.
    virtual std::vector<std::string> extractImageSources(const std::string& html) const = 0;
};

/*
 * Finds <tag ... attr="value"> by walking the markup once, left to right.
 * Only quoted values count; an unterminated quote swallows the rest of the
 * document and yields nothing. The first occurrence of the attribute in a
 * tag wins. Values of any length are handled in constant stack space.
 */
class PatternExtractor final : public HrefExtractor {
    static bool isSpace(const char c) noexcept {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    // Scans the attributes of the tag whose name ends at `cursor`. Returns the
    // value of `attribute` if present and leaves `cursor` past the tag.
    static std::optional<std::string> readAttribute(const std::string& html, std::size_t& cursor, const std::string& attribute) {
        const std::size_t size = html.size();
        std::optional<std::string> found;

        while (cursor < size) {
            while (cursor < size && (isSpace(html[cursor]) || html[cursor] == '/')) ++cursor;
            if (cursor >= size) break;
            if (html[cursor] == '>') {
                ++cursor;
                break;
            }

            const std::size_t nameStart = cursor;
            while (cursor < size && !isSpace(html[cursor]) && html[cursor] != '=' && html[cursor] != '>' && html[cursor] != '/')
                ++cursor;
            const std::string name = lower(html.substr(nameStart, cursor - nameStart));

            while (cursor < size && isSpace(html[cursor])) ++cursor;
            if (cursor >= size || html[cursor] != '=') continue;
            ++cursor;
            while (cursor < size && isSpace(html[cursor])) ++cursor;
            if (cursor >= size) break;

            const char quote = html[cursor];
            if (quote == '"' || quote == '\'') {
                const std::size_t close = html.find(quote, cursor + 1);
                if (close == std::string::npos) {
                    cursor = size;
                    return std::nullopt;
                }
                if (name == attribute && !found) found = html.substr(cursor + 1, close - cursor - 1);
                cursor = close + 1;
            } else {
                while (cursor < size && !isSpace(html[cursor]) && html[cursor] != '>') ++cursor;
            }
        }
        return found;
    }

    static std::vector<std::string> collect(const std::string& html, const std::string& tag, const std::string& attribute) {
        std::vector<std::string> values;
        std::size_t pos = 0;

        while ((pos = html.find('<', pos)) != std::string::npos) {
            std::size_t cursor = pos + 1;
            while (cursor < html.size() && !isSpace(html[cursor]) && html[cursor] != '>' && html[cursor] != '/') ++cursor;

            if (lower(html.substr(pos + 1, cursor - pos - 1)) != tag) {
                pos = cursor;
                continue;
            }
            if (auto value = readAttribute(html, cursor, attribute)) values.emplace_back(std::move(*value));
            pos = cursor;
        }
        return values;
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
