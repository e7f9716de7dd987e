#include "upnp_device.hpp"

#include "xml_utils.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>

using namespace rapidxml;

namespace upnp
{

static void collect_services(const utils::xml_node* device_node, const std::string& base, std::vector<upnp_service>& services)
{
    const utils::xml_node* service_root = utils::first_child(device_node, "serviceList");
    for(const utils::xml_node* service_node = service_root ? service_root->first_node() : nullptr; service_node; service_node = service_node->next_sibling())
    {
        if(service_node->type() != node_element || utils::local_name(service_node) != "service")
            continue;

        // The serviceId is the last part of a schema string with the form urn:upnp-org:serviceId:ContentDirectory
        std::string service_id = utils::child_value(service_node, "serviceId");
        size_t service_offset = service_id.find_last_of(':');
        if(service_offset != std::string::npos)
            service_id.erase(0, service_offset + 1);

        auto absolute = [&base](const std::string& ref) {
            return ref.empty() ? ref : utils::resolve_url(base, ref);
        };

        services.emplace_back(upnp_service {
            utils::child_value(service_node, "serviceType"),
            service_id,
            absolute(utils::child_value(service_node, "controlURL")),
            absolute(utils::child_value(service_node, "SCPDURL")),
            absolute(utils::child_value(service_node, "eventSubURL"))
        });
    }

    // Embedded devices (e.g. a MediaServer inside a Sonos ZonePlayer)
    const utils::xml_node* device_list = utils::first_child(device_node, "deviceList");
    for(const utils::xml_node* child = device_list ? device_list->first_node() : nullptr; child; child = child->next_sibling())
    {
        if(child->type() == node_element && utils::local_name(child) == "device")
            collect_services(child, base, services);
    }
}

device_description::device_description(std::string_view xml, const std::string& location)
{
    utils::xml_document doc {xml};

    const utils::xml_node* root = doc.root();
    const utils::xml_node* device_node = utils::first_child(root, "device");
    if(!device_node)
        throw std::invalid_argument {"Description without device element"};

    std::string base = utils::child_value(root, "URLBase");
    if(base.empty())
        base = location;

    m_friendly_name = utils::child_value(device_node, "friendlyName");
    m_manufacturer = utils::child_value(device_node, "manufacturer");
    m_model_name = utils::child_value(device_node, "modelName");
    m_device_type = utils::child_value(device_node, "deviceType");

    collect_services(device_node, base, m_services);
}

bool device_description::service_available(std::string_view type_fragment) const
{
    return get_service_information(type_fragment).has_value();
}

std::optional<std::reference_wrapper<const upnp_service>> device_description::get_service_information(std::string_view type_fragment) const
{
    // Devices typically have around 3 to 4 services so a linear search is fine
    auto it = std::find_if(m_services.begin(), m_services.end(), [&fragment = type_fragment](const upnp_service& service) {
        return service.type.find(fragment) != std::string::npos && !service.control_url.empty();
    });

    if(it != m_services.end())
        return *it;
    else
        return std::nullopt;
}

std::optional<std::string> device_description::content_directory_url() const
{
    auto service = get_service_information("ContentDirectory");
    if(!service)
        return std::nullopt;
    return service->get().control_url;
}

std::optional<device_description> device_resolver::describe(const std::string& location) const
{
    try {
        http::response res = m_client.get(location, m_timeout);
        if(!res.ok())
        {
            m_log.debug(utils::log_category::disc, "Description {} answered with status {}", location, res.get_code());
            return std::nullopt;
        }

        return device_description {res.get_body(), location};
    } catch(const http::transport_error& e) {
        m_log.debug(utils::log_category::net, "Fetching description {} failed: {}", location, e.what());
    } catch(const rapidxml::parse_error& e) {
        m_log.debug(utils::log_category::xml, "Description {} is not valid xml: {}", location, e.what());
    } catch(const std::invalid_argument& e) {
        m_log.debug(utils::log_category::xml, "Description {} rejected: {}", location, e.what());
    }

    return std::nullopt;
}

std::optional<std::string> device_resolver::resolve_content_directory(const std::string& location) const
{
    std::optional<device_description> description = describe(location);
    if(!description)
        return std::nullopt;

    std::optional<std::string> url = description->content_directory_url();
    if(url)
        m_log.debug(utils::log_category::disc, "ContentDirectory of {} at {}", location, *url);
    else
        m_log.debug(utils::log_category::disc, "{} has no ContentDirectory service", location);
    return url;
}

} // namespace upnp
