#ifndef MOP_SSDP_DISCOVERY_HPP
#define MOP_SSDP_DISCOVERY_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>

#include "config.hpp"
#include "device.hpp"
#include "device_source.hpp"
#include "http/client.hpp"
#include "logger.hpp"
#include "upnp_device.hpp"

namespace discovery
{

struct ssdp_res
{
    std::string location;
    std::string server;
    std::string st;
    std::string usn;
};

std::string build_msearch(const config::ssdp_settings& settings, const std::string& search_target);

/// Accepts only "HTTP/1.1 200 OK" answers that carry a LOCATION header
std::optional<ssdp_res> parse_response(std::string_view view);

/// Best effort name from the SERVER header, the USN or the search target (in that order)
std::string friendly_name(const ssdp_res& res);

std::string display_name(const std::string& friendly_name, const std::string& manufacturer);

/// Sends M-SEARCH requests to the ssdp multicast group and collects the answers
class ssdp_prober : public device_source
{
public:

    ssdp_prober(const http::client& client, const utils::logger& log, config::ssdp_settings settings = {});

    discovery_result probe(std::chrono::milliseconds timeout) const;

    /// on_device is called for every new device before probing continues
    discovery_result probe(std::chrono::milliseconds timeout, const device_callback& on_device) const;

    discovery_result discover(const location_set& known, const device_callback& on_device) const override;

    const char* get_name() const override
    {
        return "SSDP";
    }

    /// Parses one datagram. Returns the device if it is valid and its location is not in seen yet,
    /// in which case the location is added to seen and the ContentDirectory url gets resolved.
    std::optional<device> handle_response(std::string_view datagram, location_set& seen) const;

private:

    discovery_result run(std::chrono::milliseconds timeout, location_set seen, const device_callback& on_device) const;

    const utils::logger& m_log;

    upnp::device_resolver m_resolver;

    config::ssdp_settings m_settings;

};

} // namespace discovery

#endif
