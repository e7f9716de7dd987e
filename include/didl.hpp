#ifndef MOP_DIDL_HPP
#define MOP_DIDL_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace upnp
{

struct file_metadata
{
    std::optional<uint64_t> size;
    std::optional<std::string> duration;
    std::optional<std::string> format;     // Mime type from the protocolInfo of the resource
};

struct directory_entry
{
    std::string name;
    bool is_container = false;
    std::optional<std::string> url;         // Playable resource
    std::optional<file_metadata> metadata;
};

struct didl_object
{
    std::string id;                         // DIDL object id, empty if the server did not send one
    directory_entry entry;
};

/// Items and containers of a DIDL-Lite document. Objects without title are dropped.
/// Throws rapidxml::parse_error.
std::vector<didl_object> parse_didl(std::string_view didl);

/// Extracts the DIDL-Lite document from the Result element of a Browse response and parses it.
/// Bodies without Result element are searched for items and containers directly.
/// Throws rapidxml::parse_error.
std::vector<didl_object> parse_browse_response(std::string_view body);

bool is_soap_fault(std::string_view body);

std::string build_browse_request(const std::string& object_id, int requested_count);

} // namespace upnp

#endif
