#ifndef MOP_CONFIG_HPP
#define MOP_CONFIG_HPP

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900
#define DISCOVERY_MX 3
#define DISCOVERY_READ_TIMEOUT 1000
#define DISCOVERY_TIME 5000
#define DESCRIPTION_TIMEOUT 2000

#define SCAN_PROBE_IP "8.8.8.8"
#define SCAN_PROBE_PORT 80
#define SCAN_TIMEOUT 500

#define SOAP_TIMEOUT 10000
#define HTTP_BROWSE_TIMEOUT 5000
#define BROWSE_REQUESTED_COUNT 100

#define EVENT_QUEUE_CAPACITY 100
#define REFRESH_INTERVAL 30000

#define LOG_BUFFER_CAPACITY 2000

namespace config
{

using std::chrono::milliseconds;

struct ssdp_settings
{
    std::string multicast_ip {DISCOVERY_IP};
    uint16_t multicast_port = DISCOVERY_PORT;
    std::vector<std::string> search_targets {
        "upnp:rootdevice",
        "urn:schemas-upnp-org:device:MediaServer:1"
    };
    int mx = DISCOVERY_MX;
    milliseconds read_timeout {DISCOVERY_READ_TIMEOUT};
    milliseconds overall_timeout {DISCOVERY_TIME};
    milliseconds description_timeout {DESCRIPTION_TIMEOUT};
    size_t buffer_size = 4096;
};

struct scan_settings
{
    std::vector<int> host_suffixes {1, 2, 10, 100, 200, 254};
    std::vector<uint16_t> ports {32400, 8096, 8920}; // Plex, Jellyfin, Emby
    std::vector<std::string> health_paths {"/", "/status", "/identity"};
    milliseconds attempt_timeout {SCAN_TIMEOUT};
    std::string probe_ip {SCAN_PROBE_IP};
    uint16_t probe_port = SCAN_PROBE_PORT;

    // First three octets, e.g. "192.168.1". Detected from the default route when empty
    std::optional<std::string> network_base;
};

struct browse_settings
{
    milliseconds soap_timeout {SOAP_TIMEOUT};
    milliseconds http_timeout {HTTP_BROWSE_TIMEOUT};
    int requested_count = BROWSE_REQUESTED_COUNT;
};

struct discovery_settings
{
    size_t queue_capacity = EVENT_QUEUE_CAPACITY;
    milliseconds refresh_interval {REFRESH_INTERVAL};
    ssdp_settings ssdp;
    scan_settings scan;
};

} // namespace config

#endif
