#ifndef SW_DOCUMENT
#define SW_DOCUMENT

#include "Node.hpp"

using HtmlDocumentPtr = std::unique_ptr<lxb_html_document_t, decltype(&lxb_html_document_destroy)>;

class Document {
public:
    explicit Document(HtmlDocumentPtr&& doc) : doc_(std::move(doc)), collection_(doc_.get()) {}

    // <body> of the parsed page; the HTML parser always synthesizes one.
    std::unique_ptr<Node> body() {
        lxb_html_body_element_t* bodyElement = lxb_html_document_body_element(doc_.get());
        if (!bodyElement) {
            throw std::runtime_error("Failed to obtain body element");
        }
        return std::make_unique<Node>(lxb_dom_interface_node(bodyElement), collection_);
    }

private:
    HtmlDocumentPtr doc_;
    DomCollection collection_;
};

#endif
