#ifndef MOP_PORT_SCAN_HPP
#define MOP_PORT_SCAN_HPP

#include <string>
#include <optional>

#include "config.hpp"
#include "device.hpp"
#include "device_source.hpp"
#include "http/client.hpp"
#include "logger.hpp"

namespace discovery
{

/// Vendor label for well known media server ports, e.g. "Plex Server (192.168.1.10:32400)"
std::string server_name(const std::string& ip, uint16_t port);

/// Fallback for networks without working multicast. Probes a handful of likely hosts of the
/// local /24 network on the ports of common media servers.
class port_scanner : public device_source
{
public:

    port_scanner(const http::client& client, const utils::logger& log, config::scan_settings settings = {});

    discovery_result scan(const device_callback& on_device = {}) const;

    discovery_result scan(const location_set& known, const device_callback& on_device) const;

    discovery_result discover(const location_set& known, const device_callback& on_device) const override
    {
        return scan(known, on_device);
    }

    const char* get_name() const override
    {
        return "port scan";
    }

    /// First three octets of the local address, e.g. "192.168.1". Throws std::runtime_error
    std::string network_base() const;

    std::optional<device> scan_endpoint(const std::string& ip, uint16_t port) const;

private:

    const http::client& m_client;

    const utils::logger& m_log;

    config::scan_settings m_settings;

};

} // namespace discovery

#endif
