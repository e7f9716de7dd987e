#ifndef MOP_CONTENT_BROWSER_HPP
#define MOP_CONTENT_BROWSER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>

#include "config.hpp"
#include "device.hpp"
#include "didl.hpp"
#include "http/client.hpp"
#include "logger.hpp"

namespace upnp
{

/// Every browsing strategy failed
class browse_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

using browse_path = std::vector<std::string>;

/// Maps browsing paths to ContentDirectory container ids. Owned by the session, the root maps to "0".
/// Not thread safe, browses sharing one cache have to be serialized by the caller.
class container_cache
{
public:

    container_cache();

    // Path segments joined with '/', the root is the empty string
    static std::string key(const browse_path& path);

    // Container id for path, "0" if the path was never seen
    std::string lookup(const browse_path& path) const;

    std::optional<std::string> find(const std::string& key) const;

    /// Records id for key unless key is already known. Returns true if it was added
    bool remember(const std::string& key, const std::string& id);

    void reset();

    size_t size() const
    {
        return m_ids.size();
    }

private:

    std::map<std::string, std::string> m_ids;

};

/// Directory listing out of a json answer of Plex or Emby/Jellyfin style servers. Empty if the shape is unknown
std::vector<directory_entry> parse_json_directory(std::string_view body);

/// Anchor scraping for plain html index pages. Hrefs ending in '/' are directories,
/// file entries carry the href resolved against page_url.
std::vector<directory_entry> parse_html_directory(std::string_view html, const std::string& page_url);

class content_browser
{
public:

    content_browser(const http::client& client, const utils::logger& log, config::browse_settings settings = {});

    /// Lists the children of path on the device. ContentDirectory first, heuristic http browsing second.
    /// Throws browse_error if neither yields entries.
    std::vector<directory_entry> browse(const discovery::device& dev, const browse_path& path, container_cache& cache) const;

    /// SOAP Browse against a ContentDirectory control url. Empty on transport errors, bad status, faults or bad xml
    std::optional<std::vector<directory_entry>> browse_content_directory(const std::string& control_url, const browse_path& path, container_cache& cache) const;

    /// Tries the well known media server endpoints at the root and the joined path below it
    std::optional<std::vector<directory_entry>> browse_http(const std::string& base_url, const browse_path& path) const;

private:

    std::vector<directory_entry> parse_http_listing(const http::response& res, const std::string& page_url) const;

    const http::client& m_client;

    const utils::logger& m_log;

    config::browse_settings m_settings;

};

} // namespace upnp

#endif
