#ifndef SW_NODE
#define SW_NODE

#include "NodeList.hpp"
#include <optional>
#include <string>
#include <utility>

class Node {
    lxb_dom_node_t* node_;
    DomCollection& collection_;

    lxb_dom_element_t* element() const noexcept {
        return node_->type == LXB_DOM_NODE_TYPE_ELEMENT ? lxb_dom_interface_element(node_) : nullptr;
    }

public:
    Node(lxb_dom_node_t* node, DomCollection& col) : node_(node), collection_(col) {}

    std::optional<std::string> getAttribute(const std::string& name) const {
        auto* el = element();
        if (!el) return std::nullopt;
        auto* attr = lxb_dom_element_attr_by_name(el, reinterpret_cast<const lxb_char_t*>(name.c_str()), name.length());
        if (!attr) return std::nullopt;
        std::size_t len = 0;
        const lxb_char_t* value = lxb_dom_attr_value(attr, &len);
        if (!value) return std::string();
        return std::string(reinterpret_cast<const char*>(value), len);
    }

    bool hasAttribute(const std::string& name) const {
        auto* el = element();
        if (!el) return false;
        return lxb_dom_element_has_attribute(el, reinterpret_cast<const lxb_char_t*>(name.c_str()), name.length());
    }

    std::unique_ptr<NodeList> getElementsByTagName(const std::string& tag) const {
        collection_.clean();
        auto* el = element();
        if (!el) return std::make_unique<NodeList>(collection_);
        const lxb_status_t status = lxb_dom_elements_by_tag_name(el, collection_.get(),
            reinterpret_cast<const lxb_char_t*>(tag.c_str()), tag.length());
        if (status != LXB_STATUS_OK) {
            throw std::runtime_error("Failed to collect elements by tag name: " + tag);
        }
        return std::make_unique<NodeList>(collection_);
    }

    // Values of `attr` on every descendant `tag` element carrying it, in document order.
    std::vector<std::string> collectAttribute(const std::string& tag, const std::string& attr) const {
        std::vector<std::string> values;
        auto list = getElementsByTagName(tag);
        for (std::size_t i = 0; i < list->length(); ++i) {
            if (auto value = list->item(i)->getAttribute(attr)) values.emplace_back(std::move(*value));
        }
        return values;
    }
};

inline std::unique_ptr<Node> NodeList::item(const std::size_t index) const {
    if (index >= nodes.size()) return nullptr;
    return std::make_unique<Node>(nodes[index], collection_);
}

#endif
