#include "didl.hpp"

#include "xml_utils.hpp"
#include "utils.hpp"

#include "fmt/format.h"

#include <cctype>
#include <charconv>

namespace upnp
{

static std::optional<file_metadata> parse_resource(const utils::xml_node* res)
{
    if(!res)
        return std::nullopt;

    file_metadata meta;

    std::string size = utils::attribute_value(res, "size");
    uint64_t bytes = 0;
    auto parsed = std::from_chars(size.data(), size.data() + size.size(), bytes);
    if(!size.empty() && parsed.ec == std::errc {})
        meta.size = bytes;

    std::string duration = utils::attribute_value(res, "duration");
    if(!duration.empty())
        meta.duration = duration;

    // protocolInfo has the form http-get:*:video/mp4:DLNA.ORG_PN=...
    std::string_view protocol_info = utils::trim(utils::attribute_value(res, "protocolInfo"));
    for(int field = 0; field < 2 && !protocol_info.empty(); ++field)
    {
        size_t colon = protocol_info.find(':');
        protocol_info = (colon == std::string_view::npos) ? std::string_view {} : protocol_info.substr(colon + 1);
    }
    protocol_info = protocol_info.substr(0, protocol_info.find(':'));
    if(!protocol_info.empty() && protocol_info != "*")
        meta.format = std::string {protocol_info};

    return meta;
}

static void collect_objects(const utils::xml_node* node, std::vector<didl_object>& objects)
{
    for(const utils::xml_node* child = node ? node->first_node() : nullptr; child; child = child->next_sibling())
    {
        if(child->type() != rapidxml::node_element)
            continue;

        std::string_view name = utils::local_name(child);
        if(name != "item" && name != "container")
        {
            collect_objects(child, objects);
            continue;
        }

        didl_object obj;
        obj.id = utils::attribute_value(child, "id");
        obj.entry.name = utils::child_value(child, "title");
        obj.entry.is_container = (name == "container");
        if(obj.entry.name.empty())
            continue;

        if(!obj.entry.is_container)
        {
            const utils::xml_node* res = utils::first_child(child, "res");
            std::string url = utils::child_value(child, "res");
            if(!url.empty())
                obj.entry.url = std::move(url);
            obj.entry.metadata = parse_resource(res);
        }

        objects.push_back(std::move(obj));
    }
}

std::vector<didl_object> parse_didl(std::string_view didl)
{
    std::vector<didl_object> objects;
    if(utils::trim(didl).empty())
        return objects;

    utils::xml_document doc {didl};
    collect_objects(doc.document(), objects);
    return objects;
}

std::vector<didl_object> parse_browse_response(std::string_view body)
{
    utils::xml_document doc {body};

    // The DIDL-Lite document arrives entity encoded as text of the Result element
    if(const utils::xml_node* result = utils::find_descendant(doc.root(), "Result"))
    {
        const utils::xml_node* cdata = result->first_node();
        if(result->value_size() == 0 && cdata && cdata->type() == rapidxml::node_cdata)
            return parse_didl(std::string_view {cdata->value(), cdata->value_size()});
        return parse_didl(std::string_view {result->value(), result->value_size()});
    }

    std::vector<didl_object> objects;
    collect_objects(doc.document(), objects);
    return objects;
}

// True when an element tag named tag opens somewhere in body
static bool has_element(std::string_view body, std::string_view tag)
{
    for(size_t pos = body.find(tag); pos != std::string_view::npos; pos = body.find(tag, pos + 1))
    {
        size_t end = pos + tag.size();
        if(end < body.size() && (body[end] == '>' || body[end] == '/' || std::isspace(static_cast<unsigned char>(body[end]))))
            return true;
    }
    return false;
}

bool is_soap_fault(std::string_view body)
{
    return has_element(body, "<soap:Fault") ||
        has_element(body, "<SOAP-ENV:Fault") ||
        has_element(body, "<s:Fault");
}

std::string build_browse_request(const std::string& object_id, int requested_count)
{
    return fmt::format(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">"
        "<s:Body>"
        "<u:Browse xmlns:u=\"urn:schemas-upnp-org:service:ContentDirectory:1\">"
        "<ObjectID>{}</ObjectID>"
        "<BrowseFlag>BrowseDirectChildren</BrowseFlag>"
        "<Filter>*</Filter>"
        "<StartingIndex>0</StartingIndex>"
        "<RequestedCount>{}</RequestedCount>"
        "<SortCriteria></SortCriteria>"
        "</u:Browse>"
        "</s:Body>"
        "</s:Envelope>",
        utils::xml_escape(object_id), requested_count);
}

} // namespace upnp
