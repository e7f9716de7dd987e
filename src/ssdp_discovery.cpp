#include "ssdp_discovery.hpp"

#include <socketwrapper.hpp>

#include "fmt/format.h"
#include "utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>
#include <poll.h>

namespace discovery
{

struct vendor_pattern
{
    const char* fragment;
    const char* name;
};

// Checked in this order against the lower case SERVER header
static constexpr vendor_pattern vendor_table[] = {
    {"plex", "Plex Media Server"},
    {"platinum", "Plex Media Server"},
    {"jellyfin", "Jellyfin Server"},
    {"emby", "Emby Server"},
    {"sonos", "Sonos Speaker"},
    {"chromecast", "Chromecast"},
    {"hue", "Philips Hue Bridge"},
    {"hp-ilo", "HP iLO Server"}
};

std::string build_msearch(const config::ssdp_settings& settings, const std::string& search_target)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nMAN: \"ssdp:discover\"\r\nST: {}\r\nMX: {}\r\n\r\n",
        settings.multicast_ip, settings.multicast_port, search_target, settings.mx);
}

std::optional<ssdp_res> parse_response(std::string_view view)
{
    if(view.rfind("HTTP/1.1 200 OK", 0) != 0)
        return std::nullopt;

    ssdp_res res;

    size_t endl = view.find('\n');
    view = (endl == std::string_view::npos) ? std::string_view {} : view.substr(endl + 1);
    while(!view.empty())
    {
        endl = view.find('\n');
        std::string_view line = utils::trim(view.substr(0, endl));
        view = (endl == std::string_view::npos) ? std::string_view {} : view.substr(endl + 1);

        size_t sep = line.find(':');
        if(line.empty() || sep == std::string_view::npos)
            continue;

        std::string key = utils::to_lower(utils::trim(line.substr(0, sep)));
        std::string_view val = utils::trim(line.substr(sep + 1));
        if(key == "location")
            res.location = val;
        else if(key == "server")
            res.server = val;
        else if(key == "st")
            res.st = val;
        else if(key == "usn")
            res.usn = val;
    }

    if(res.location.empty())
        return std::nullopt;

    return res;
}

std::string friendly_name(const ssdp_res& res)
{
    if(!res.server.empty())
    {
        std::string server = utils::to_lower(res.server);
        for(const auto& vendor : vendor_table)
        {
            if(server.find(vendor.fragment) != std::string::npos)
                return vendor.name;
        }
    }

    if(res.usn.find("RINCON_") != std::string::npos)
        return "Sonos Speaker";

    if(size_t uuid_start = res.usn.find("uuid:"); uuid_start != std::string::npos)
    {
        std::string_view uuid {res.usn};
        uuid.remove_prefix(uuid_start + 5);
        uuid = uuid.substr(0, uuid.find("::"));
        if(!uuid.empty())
            return fmt::format("Device {}", uuid.substr(0, 8));
    }

    if(res.st == "urn:schemas-upnp-org:device:MediaServer:1")
        return "Media Server";
    if(res.st == "upnp:rootdevice")
        return "UPnP Device";
    if(res.st == "urn:schemas-upnp-org:device:basic:1")
        return "Basic Device";
    if(!res.st.empty())
        return res.st;
    return "Unknown Device";
}

std::string display_name(const std::string& friendly_name, const std::string& manufacturer)
{
    if(manufacturer.empty())
        return friendly_name;
    return fmt::format("{} ({})", friendly_name, manufacturer);
}

ssdp_prober::ssdp_prober(const http::client& client, const utils::logger& log, config::ssdp_settings settings)
    : m_log {log},
      m_resolver {client, log, settings.description_timeout},
      m_settings {std::move(settings)}
{}

discovery_result ssdp_prober::probe(std::chrono::milliseconds timeout) const
{
    return run(timeout, {}, device_callback {});
}

discovery_result ssdp_prober::probe(std::chrono::milliseconds timeout, const device_callback& on_device) const
{
    return run(timeout, {}, on_device);
}

discovery_result ssdp_prober::discover(const location_set& known, const device_callback& on_device) const
{
    return run(m_settings.overall_timeout, known, on_device);
}

std::optional<device> ssdp_prober::handle_response(std::string_view datagram, location_set& seen) const
{
    std::optional<ssdp_res> res = parse_response(datagram);
    if(!res)
    {
        m_log.debug(utils::log_category::disc, "Ignoring ssdp datagram: {}", datagram.substr(0, 200));
        return std::nullopt;
    }

    if(!seen.insert(res->location).second)
    {
        m_log.debug(utils::log_category::disc, "Duplicate ssdp response for {}", res->location);
        return std::nullopt;
    }

    std::string friendly = friendly_name(*res);
    std::string name = display_name(friendly, res->server);
    std::string base = utils::base_url(res->location);
    std::optional<std::string> content_directory = m_resolver.resolve_content_directory(res->location);

    m_log.info(utils::log_category::disc, "Found {} at {}", name, res->location);
    return device {
        std::move(name),
        std::move(friendly),
        res->location,
        std::move(base),
        res->server,
        res->st,
        res->usn,
        std::move(content_directory),
        device_origin::ssdp
    };
}

discovery_result ssdp_prober::run(std::chrono::milliseconds timeout, location_set seen, const device_callback& on_device) const
{
    using namespace std::chrono;

    discovery_result result;

    in_addr multicast_addr;
    if(inet_pton(AF_INET, m_settings.multicast_ip.c_str(), &multicast_addr) != 1)
    {
        result.errors.push_back(fmt::format("Failed to resolve multicast address {}:{}", m_settings.multicast_ip, m_settings.multicast_port));
        return result;
    }

    std::optional<net::udp_socket<net::ip_version::v4>> d_sock;
    try {
        // Ephemeral port, answers are sent back unicast
        d_sock.emplace("0.0.0.0", 0);
    } catch(const std::runtime_error& e) {
        result.errors.push_back(fmt::format("Failed to create UDP socket: {}", e.what()));
        return result;
    }
    m_log.info(utils::log_category::net, "SSDP socket bound to 0.0.0.0:0");

    for(size_t i = 0; i < m_settings.search_targets.size(); ++i)
    {
        const std::string& target = m_settings.search_targets[i];
        std::string msg = build_msearch(m_settings, target);
        try {
            d_sock->send(m_settings.multicast_ip, m_settings.multicast_port, msg);
            m_log.info(utils::log_category::disc, "Sent M-SEARCH for {} to {}:{}", target, m_settings.multicast_ip, m_settings.multicast_port);
        } catch(const std::runtime_error& e) {
            if(i == 0)
            {
                result.errors.push_back(fmt::format("Failed to send M-SEARCH: {}", e.what()));
                return result;
            }
            m_log.warn(utils::log_category::disc, "Sending M-SEARCH for {} failed: {}", target, e.what());
        }
    }

    const auto start = steady_clock::now();
    size_t response_count = 0;
    for(;;)
    {
        auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
        if(elapsed >= timeout)
        {
            m_log.info(utils::log_category::disc, "SSDP ceiling of {}ms reached after {} responses", timeout.count(), response_count);
            break;
        }

        // Per read deadline, capped by what is left of the overall ceiling
        milliseconds wait = std::min(m_settings.read_timeout, timeout - elapsed);
        pollfd pfd {d_sock->get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));
        if(ready == 0)
        {
            m_log.info(utils::log_category::disc, "SSDP timeout after {} responses", response_count);
            break;
        }
        if(ready < 0)
        {
            if(errno != EINTR)
                m_log.warn(utils::log_category::net, "SSDP poll failed: {}", std::strerror(errno));
            continue;
        }

        try {
            auto [buffer, peer] = d_sock->read<char>(m_settings.buffer_size);
            ++response_count;
            m_log.debug(utils::log_category::disc, "Received ssdp response {} ({} bytes)", response_count, buffer.size());

            std::optional<device> dev = handle_response(std::string_view {buffer.data(), buffer.size()}, seen);
            if(!dev)
                continue;

            result.devices.push_back(*dev);
            if(on_device)
                on_device(result.devices.back());
        } catch(const std::runtime_error& e) {
            m_log.warn(utils::log_category::net, "SSDP read error: {}", e.what());
        }
    }

    m_log.info(utils::log_category::disc, "SSDP discovery complete: found {} devices", result.devices.size());
    return result;
}

} // namespace discovery
