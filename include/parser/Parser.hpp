#ifndef SW_PARSER
#define SW_PARSER

#include "Document.hpp"
#include <string>

class Parser {
    std::unique_ptr<lxb_html_parser_t, decltype(&lxb_html_parser_destroy)>
        parser { lxb_html_parser_create(), &lxb_html_parser_destroy };

    static void check(const lxb_status_t status, const char* errMsg) {
        if (status != LXB_STATUS_OK) {
            throw std::runtime_error(errMsg);
        }
    }

public:
    Parser() {
        if (!parser) throw std::runtime_error("Failed to allocate HTML parser");
        check(lxb_html_parser_init(parser.get()), "Failed to initialize HTML parser");
    }

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    Document createDOM(const std::string& html) {
        auto* document = lxb_html_parse(parser.get(), reinterpret_cast<const lxb_char_t*>(html.c_str()), html.length());
        if (!document) {
            throw std::runtime_error("Failed to parse HTML");
        }
        return Document(HtmlDocumentPtr(document, &lxb_html_document_destroy));
    }
};

#endif
