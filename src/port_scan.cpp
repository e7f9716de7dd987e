#include "port_scan.hpp"

#include "fmt/format.h"
#include "utils.hpp"

#include <stdexcept>

namespace discovery
{

std::string server_name(const std::string& ip, uint16_t port)
{
    switch(port)
    {
        case 32400:
            return fmt::format("Plex Server ({}:{})", ip, port);
        case 8096:
            return fmt::format("Jellyfin Server ({}:{})", ip, port);
        case 8920:
            return fmt::format("Emby Server ({}:{})", ip, port);
        default:
            return fmt::format("Media Server ({}:{})", ip, port);
    }
}

port_scanner::port_scanner(const http::client& client, const utils::logger& log, config::scan_settings settings)
    : m_client {client},
      m_log {log},
      m_settings {std::move(settings)}
{}

std::string port_scanner::network_base() const
{
    if(m_settings.network_base)
        return *m_settings.network_base;

    std::string ip;
    try {
        ip = utils::get_route_ipaddr(m_settings.probe_ip, m_settings.probe_port);
    } catch(const std::runtime_error& e) {
        m_log.debug(utils::log_category::net, "No route to {}: {}, using interface address", m_settings.probe_ip, e.what());
        ip = utils::get_local_ipaddr();
    }

    size_t last_dot = ip.rfind('.');
    if(last_dot == std::string::npos || last_dot == 0)
        throw std::runtime_error {"invalid IP address: " + ip};
    return ip.substr(0, last_dot);
}

std::optional<device> port_scanner::scan_endpoint(const std::string& ip, uint16_t port) const
{
    const std::string url = fmt::format("http://{}:{}", ip, port);

    for(const auto& path : m_settings.health_paths)
    {
        try {
            http::response res = m_client.get(url + path, m_settings.attempt_timeout);
            if(!res.ok())
                continue;

            std::string name = server_name(ip, port);
            m_log.info(utils::log_category::disc, "Port scan found {}", name);
            return device {
                name,
                name,
                url,
                url,
                "",
                "MediaServer",
                "",
                std::nullopt,
                device_origin::port_scan
            };
        } catch(const http::connect_error& e) {
            // Nothing listening, the other paths will not answer either
            m_log.debug(utils::log_category::net, "{}: {}", url, e.what());
            return std::nullopt;
        } catch(const http::transport_error& e) {
            m_log.debug(utils::log_category::net, "{}{}: {}", url, path, e.what());
        } catch(const std::invalid_argument& e) {
            m_log.debug(utils::log_category::http, "{}{} sent garbage: {}", url, path, e.what());
        }
    }

    return std::nullopt;
}

discovery_result port_scanner::scan(const device_callback& on_device) const
{
    return scan(location_set {}, on_device);
}

discovery_result port_scanner::scan(const location_set& known, const device_callback& on_device) const
{
    discovery_result result;

    std::string base;
    try {
        base = network_base();
    } catch(const std::runtime_error& e) {
        result.errors.push_back(fmt::format("Failed to get local network: {}", e.what()));
        return result;
    }
    m_log.info(utils::log_category::disc, "Port scanning {}.x", base);

    location_set seen {known};
    for(int suffix : m_settings.host_suffixes)
    {
        std::string ip = fmt::format("{}.{}", base, suffix);
        for(uint16_t port : m_settings.ports)
        {
            std::optional<device> dev = scan_endpoint(ip, port);
            if(!dev || !seen.insert(dev->get_location()).second)
                continue;

            result.devices.push_back(*dev);
            if(on_device)
                on_device(result.devices.back());
        }
    }

    m_log.info(utils::log_category::disc, "Port scan complete: found {} devices", result.devices.size());
    return result;
}

} // namespace discovery
