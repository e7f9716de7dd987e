#ifndef MOP_UTILS_HPP
#define MOP_UTILS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace utils
{

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port;
    std::string path; // Always starts with '/', includes the query string

    // scheme://host:port without path
    std::string origin() const;
};

/// Splits an absolute http(s) url. Throws std::invalid_argument if the string is not one
url parse_url(std::string_view location);

// Returns scheme://host:port of location or location itself if it can not be parsed
std::string base_url(const std::string& location);

/// Resolves reference against the document url it was found in.
/// Absolute references are returned untouched, a leading slash is relative to the host root
/// and everything else is relative to the directory of the document.
std::string resolve_url(const std::string& document_url, const std::string& reference);

std::string to_lower(std::string_view view);

bool contains_icase(std::string_view haystack, std::string_view needle);

std::string_view trim(std::string_view view);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

std::string xml_escape(std::string_view view);

// Percent encodes everything except unreserved characters, for use as one path segment
std::string percent_encode(std::string_view segment);

std::string percent_decode(std::string_view view);

/// Address of the first interface which is up and not a loopback device
std::string get_local_ipaddr();

/// Local address the kernel would use to reach probe_ip, found by connecting a udp socket.
/// No datagram is sent.
std::string get_route_ipaddr(const std::string& probe_ip, uint16_t probe_port);

} // utils

#endif
