#ifndef MOP_DEVICE_HPP
#define MOP_DEVICE_HPP

#include <string>
#include <optional>
#include <unordered_set>
#include <functional>

namespace discovery
{

enum class device_origin
{
    ssdp,
    port_scan
};

/// A media device found on the local network. The location url is the identity of a device,
/// two records with the same location describe the same device.
class device
{
public:

    device(std::string name,
           std::string friendly_name,
           std::string location,
           std::string base_url,
           std::string server,
           std::string device_type,
           std::string usn,
           std::optional<std::string> content_directory_url,
           device_origin origin)
        : m_name {std::move(name)},
          m_friendly_name {std::move(friendly_name)},
          m_location {std::move(location)},
          m_base_url {std::move(base_url)},
          m_server {std::move(server)},
          m_device_type {std::move(device_type)},
          m_usn {std::move(usn)},
          m_content_directory_url {std::move(content_directory_url)},
          m_origin {origin}
    {}

    inline const std::string& get_name() const
    {
        return m_name;
    }

    inline const std::string& get_friendly_name() const
    {
        return m_friendly_name;
    }

    inline const std::string& get_location() const
    {
        return m_location;
    }

    inline const std::string& get_base_url() const
    {
        return m_base_url;
    }

    // SERVER header of the ssdp response, empty if unknown
    inline const std::string& get_server() const
    {
        return m_server;
    }

    inline const std::string& get_device_type() const
    {
        return m_device_type;
    }

    inline const std::string& get_usn() const
    {
        return m_usn;
    }

    inline const std::optional<std::string>& get_content_directory_url() const
    {
        return m_content_directory_url;
    }

    inline device_origin get_origin() const
    {
        return m_origin;
    }

    bool operator==(const device& other) const
    {
        return m_location == other.m_location;
    }

    bool operator!=(const device& other) const
    {
        return !(*this == other);
    }

private:

    std::string m_name;                                 // Display name

    std::string m_friendly_name;

    std::string m_location;                             // Url of the device description

    std::string m_base_url;                             // scheme://host:port

    std::string m_server;

    std::string m_device_type;                          // Search target the device answered

    std::string m_usn;

    std::optional<std::string> m_content_directory_url; // Control url of the ContentDirectory service

    device_origin m_origin;

};

using location_set = std::unordered_set<std::string>;

using device_callback = std::function<void(const device&)>;

} // namespace discovery

#endif
