#ifndef SW_DOM_COLLECTION
#define SW_DOM_COLLECTION

#include <lexbor/html/html.h>
#include <lexbor/dom/collection.h>
#include <lexbor/dom/interfaces/element.h>
#include <memory>
#include <stdexcept>

// Scratch collection reused by every element query on one document.
class DomCollection {
public:
    explicit DomCollection(lxb_html_document_t* document)
        : collection_(lxb_dom_collection_make(&document->dom_document, 128), &DomCollection::deleter) {
        if (!collection_) {
            throw std::runtime_error("Failed to create DOM collection");
        }
    }

    lxb_dom_collection_t* get() const noexcept {
        return collection_.get();
    }

    std::size_t length() const noexcept {
        return lxb_dom_collection_length(collection_.get());
    }

    lxb_dom_node_t* node(const std::size_t index) const noexcept {
        return lxb_dom_collection_node(collection_.get(), index);
    }

    void clean() const noexcept {
        lxb_dom_collection_clean(collection_.get());
    }

private:
    static void deleter(lxb_dom_collection_t* collection) {
        lxb_dom_collection_destroy(collection, true);
    }

    std::unique_ptr<lxb_dom_collection_t, decltype(&deleter)> collection_;
};

#endif
