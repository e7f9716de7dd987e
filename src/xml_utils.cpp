#include "xml_utils.hpp"

#include "utils.hpp"

namespace utils
{

xml_document::xml_document(std::string_view text)
    : m_buffer(text.begin(), text.end())
{
    // rapidxml parses in place and needs a terminated buffer
    m_buffer.push_back('\0');
    m_doc.parse<rapidxml::parse_default>(m_buffer.data());
}

std::string_view local_name(const xml_node* node)
{
    std::string_view name {node->name(), node->name_size()};
    size_t colon = name.find(':');
    return (colon == std::string_view::npos) ? name : name.substr(colon + 1);
}

const xml_node* first_child(const xml_node* node, std::string_view name)
{
    if(!node)
        return nullptr;

    for(const xml_node* child = node->first_node(); child; child = child->next_sibling())
    {
        if(child->type() == rapidxml::node_element && local_name(child) == name)
            return child;
    }
    return nullptr;
}

const xml_node* find_descendant(const xml_node* node, std::string_view name)
{
    if(!node)
        return nullptr;

    for(const xml_node* child = node->first_node(); child; child = child->next_sibling())
    {
        if(child->type() != rapidxml::node_element)
            continue;
        if(local_name(child) == name)
            return child;
        if(const xml_node* found = find_descendant(child, name))
            return found;
    }
    return nullptr;
}

std::string child_value(const xml_node* node, std::string_view name)
{
    const xml_node* child = first_child(node, name);
    if(!child)
        return {};
    return std::string {trim(std::string_view {child->value(), child->value_size()})};
}

std::string attribute_value(const xml_node* node, std::string_view name)
{
    if(!node)
        return {};

    for(const rapidxml::xml_attribute<char>* attr = node->first_attribute(); attr; attr = attr->next_attribute())
    {
        if(std::string_view {attr->name(), attr->name_size()} == name)
            return std::string {attr->value(), attr->value_size()};
    }
    return {};
}

} // namespace utils
