#ifndef MOP_XML_UTILS_HPP
#define MOP_XML_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>

#include "rapidxml/rapidxml.hpp"

namespace utils
{

using xml_node = rapidxml::xml_node<char>;

/// Owns the mutable buffer rapidxml parses in place. Throws rapidxml::parse_error
class xml_document
{
public:

    xml_document(const xml_document&) = delete;
    xml_document& operator=(const xml_document&) = delete;

    explicit xml_document(std::string_view text);

    // First top level element, nullptr for documents without one
    const xml_node* root() const
    {
        const xml_node* node = m_doc.first_node();
        while(node && node->type() != rapidxml::node_element)
            node = node->next_sibling();
        return node;
    }

    const xml_node* document() const
    {
        return &m_doc;
    }

private:

    std::vector<char> m_buffer;

    rapidxml::xml_document<char> m_doc;

};

// Element name without namespace prefix
std::string_view local_name(const xml_node* node);

/// First child element with the given local name or nullptr
const xml_node* first_child(const xml_node* node, std::string_view name);

/// First element with the given local name in the subtree below node (depth first) or nullptr
const xml_node* find_descendant(const xml_node* node, std::string_view name);

/// Trimmed text of the first child element with the given local name, empty if missing
std::string child_value(const xml_node* node, std::string_view name);

std::string attribute_value(const xml_node* node, std::string_view name);

} // namespace utils

#endif
