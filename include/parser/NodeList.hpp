#ifndef SW_NODE_LIST
#define SW_NODE_LIST

#include "DomCollection.hpp"
#include <vector>

class Node;

// Copies the element pointers out of the shared collection, so the list stays
// valid after the next query cleans it.
class NodeList {
    std::vector<lxb_dom_node_t*> nodes;
    DomCollection& collection_;

public:
    explicit NodeList(DomCollection& collection) : collection_(collection) {
        const std::size_t len = collection_.length();
        nodes.reserve(len);
        for (std::size_t i = 0; i < len; ++i) {
            lxb_dom_node_t* node = collection_.node(i);
            if (node && node->type == LXB_DOM_NODE_TYPE_ELEMENT) nodes.emplace_back(node);
        }
    }

    std::size_t length() const noexcept {
        return nodes.size();
    }

    std::unique_ptr<Node> item(const std::size_t index) const;
};

#endif
