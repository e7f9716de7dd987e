#include <utils.hpp>

#include <array>
#include <bitset>
#include <algorithm>
#include <charconv>
#include <cctype>
#include <stdexcept>
#include <ifaddrs.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string url::origin() const
{
    return scheme + "://" + host + ":" + std::to_string(port);
}

url parse_url(std::string_view location)
{
    url parsed;

    location = trim(location);
    size_t tmp = location.find("://");
    if(tmp == std::string_view::npos || tmp == 0)
        throw std::invalid_argument {"Not an absolute url"};

    parsed.scheme = to_lower(location.substr(0, tmp));
    if(parsed.scheme != "http" && parsed.scheme != "https")
        throw std::invalid_argument {"Unsupported url scheme"};
    location.remove_prefix(tmp + 3);

    size_t path_start = location.find_first_of("/?");
    std::string_view authority = location.substr(0, path_start);
    if(path_start == std::string_view::npos)
        parsed.path = "/";
    else if(location[path_start] == '?')
        parsed.path = "/" + std::string {location.substr(path_start)};
    else
        parsed.path = std::string {location.substr(path_start)};

    // Drop user info
    if(size_t at = authority.rfind('@'); at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view port_view;
    if(!authority.empty() && authority.front() == '[')
    {
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            throw std::invalid_argument {"Malformed ipv6 host"};
        parsed.host = std::string {authority.substr(0, close + 1)};
        if(close + 1 < authority.size() && authority[close + 1] == ':')
            port_view = authority.substr(close + 2);
    }
    else
    {
        size_t colon = authority.find(':');
        parsed.host = std::string {authority.substr(0, colon)};
        if(colon != std::string_view::npos)
            port_view = authority.substr(colon + 1);
    }

    if(parsed.host.empty())
        throw std::invalid_argument {"Url without host"};

    if(port_view.empty())
    {
        parsed.port = (parsed.scheme == "https") ? 443 : 80;
    }
    else
    {
        unsigned int port = 0;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port == 0 || port > 65535)
            throw std::invalid_argument {"Invalid port in url"};
        parsed.port = static_cast<uint16_t>(port);
    }

    return parsed;
}

std::string base_url(const std::string& location)
{
    try {
        return parse_url(location).origin();
    } catch(const std::invalid_argument&) {
        return location;
    }
}

std::string resolve_url(const std::string& document_url, const std::string& reference)
{
    std::string_view ref = trim(reference);
    if(ref.rfind("http://", 0) == 0 || ref.rfind("https://", 0) == 0)
        return std::string {ref};

    url base;
    try {
        base = parse_url(document_url);
    } catch(const std::invalid_argument&) {
        return document_url + std::string {ref};
    }

    if(!ref.empty() && ref.front() == '/')
        return base.origin() + std::string {ref};

    std::string_view dir {base.path};
    dir = dir.substr(0, dir.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return base.origin() + std::string {dir} + std::string {ref};
}

std::string to_lower(std::string_view view)
{
    std::string lower {view};
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

bool contains_icase(std::string_view haystack, std::string_view needle)
{
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
    return it != haystack.end() || needle.empty();
}

std::string_view trim(std::string_view view)
{
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.front())))
        view.remove_prefix(1);
    while(!view.empty() && std::isspace(static_cast<unsigned char>(view.back())))
        view.remove_suffix(1);
    return view;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator)
{
    std::string joined;
    for(size_t i = 0; i < parts.size(); ++i)
    {
        if(i > 0)
            joined.append(separator);
        joined.append(parts[i]);
    }
    return joined;
}

std::string xml_escape(std::string_view view)
{
    std::string escaped;
    escaped.reserve(view.size());
    for(char c : view)
    {
        switch(c)
        {
            case '&':
                escaped.append("&amp;");
                break;
            case '<':
                escaped.append("&lt;");
                break;
            case '>':
                escaped.append("&gt;");
                break;
            case '"':
                escaped.append("&quot;");
                break;
            case '\'':
                escaped.append("&apos;");
                break;
            default:
                escaped.push_back(c);
        }
    }
    return escaped;
}

std::string percent_encode(std::string_view segment)
{
    static constexpr char hex[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(segment.size());
    for(unsigned char c : segment)
    {
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            encoded.push_back(static_cast<char>(c));
        }
        else
        {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string percent_decode(std::string_view view)
{
    std::string decoded;
    decoded.reserve(view.size());
    for(size_t i = 0; i < view.size(); ++i)
    {
        unsigned int value = 0;
        if(view[i] == '%' && i + 2 < view.size() &&
            std::from_chars(view.data() + i + 1, view.data() + i + 3, value, 16).ptr == view.data() + i + 3)
        {
            decoded.push_back(static_cast<char>(value));
            i += 2;
        }
        else
        {
            decoded.push_back(view[i]);
        }
    }
    return decoded;
}

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::string found;
    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
            continue;

        std::bitset<sizeof(unsigned int) * 8> flags {curr_addr->ifa_flags};
        if (flags.test(IFF_UP) && !flags.test(IFF_LOOPBACK))
        {
            found = host.data();
            break;
        }
    }

    freeifaddrs(addrs);
    if(found.empty())
        throw std::runtime_error {error_msg};
    return found;
}

std::string get_route_ipaddr(const std::string& probe_ip, uint16_t probe_port)
{
    sockaddr_in remote {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(probe_port);
    if(inet_pton(AF_INET, probe_ip.c_str(), &remote.sin_addr) != 1)
        throw std::runtime_error {"Invalid probe address " + probe_ip};

    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if(fd < 0)
        throw std::runtime_error {error_msg};

    sockaddr_in local {};
    socklen_t len = sizeof(local);
    if(::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0 ||
        ::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0)
    {
        ::close(fd);
        throw std::runtime_error {error_msg};
    }
    ::close(fd);

    std::array<char, INET_ADDRSTRLEN> host;
    if(inet_ntop(AF_INET, &local.sin_addr, host.data(), host.size()) == nullptr)
        throw std::runtime_error {error_msg};
    return host.data();
}

} // utils
