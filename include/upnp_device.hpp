#ifndef MOP_UPNP_DEVICE_HPP
#define MOP_UPNP_DEVICE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <functional>

#include "http/client.hpp"
#include "logger.hpp"

namespace upnp
{

struct upnp_service
{
    std::string type;           // urn:schemas-upnp-org:service:ContentDirectory:1
    std::string id;             // Last part of the serviceId, e.g. ContentDirectory
    std::string control_url;    // Absolute
    std::string scpd_url;
    std::string event_sub_url;
};

/// Parsed UPnP device description document. Services of embedded devices are included.
class device_description
{
public:

    device_description() = default;

    /// Throws rapidxml::parse_error for malformed documents and std::invalid_argument if there is no device element.
    /// Relative service urls are resolved against URLBase or, if missing, location.
    device_description(std::string_view xml, const std::string& location);

    bool service_available(std::string_view type_fragment) const;

    /// First service whose type contains type_fragment and which has a control url
    std::optional<std::reference_wrapper<const upnp_service>> get_service_information(std::string_view type_fragment) const;

    std::optional<std::string> content_directory_url() const;

    const std::string& get_friendly_name() const
    {
        return m_friendly_name;
    }

    const std::string& get_manufacturer() const
    {
        return m_manufacturer;
    }

    const std::string& get_model_name() const
    {
        return m_model_name;
    }

    const std::string& get_device_type() const
    {
        return m_device_type;
    }

    const std::vector<upnp_service>& get_services() const
    {
        return m_services;
    }

private:

    std::string m_friendly_name;

    std::string m_manufacturer;

    std::string m_model_name;

    std::string m_device_type;

    std::vector<upnp_service> m_services;

};

/// Fetches device descriptions. Every failure is logged and reported as an empty result.
class device_resolver
{
public:

    device_resolver(const http::client& client, const utils::logger& log, std::chrono::milliseconds timeout)
        : m_client {client}, m_log {log}, m_timeout {timeout}
    {}

    std::optional<device_description> describe(const std::string& location) const;

    std::optional<std::string> resolve_content_directory(const std::string& location) const;

private:

    const http::client& m_client;

    const utils::logger& m_log;

    std::chrono::milliseconds m_timeout;

};

} // namespace upnp

#endif
