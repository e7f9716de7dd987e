#ifndef MOP_DEVICE_SOURCE_HPP
#define MOP_DEVICE_SOURCE_HPP

#include <string>
#include <vector>

#include "device.hpp"

namespace discovery
{

struct discovery_result
{
    std::vector<device> devices;
    std::vector<std::string> errors; // Soft errors, collected but never thrown
};

/// One way of finding devices (ssdp, port scan, ...)
class device_source
{
public:

    virtual ~device_source() = default;

    /// Runs one discovery pass. Devices with a location contained in known are skipped,
    /// on_device is called synchronously on the calling thread for every new device.
    /// Must not throw, failures are returned as soft errors.
    virtual discovery_result discover(const location_set& known, const device_callback& on_device) const = 0;

    virtual const char* get_name() const = 0;
};

} // namespace discovery

#endif
