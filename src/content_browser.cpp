#include "content_browser.hpp"

#include "utils.hpp"
#include "xml_utils.hpp"

#include "fmt/format.h"
#include "json.hpp"

using nlohmann::json;

namespace upnp
{

static const char* browse_action = "\"urn:schemas-upnp-org:service:ContentDirectory:1#Browse\"";

static const std::vector<std::string> root_endpoints {
    "/library/sections",    // Plex
    "/Users",               // Jellyfin/Emby
    "/Items",
    "/"
};

container_cache::container_cache()
{
    reset();
}

std::string container_cache::key(const browse_path& path)
{
    return utils::join(path, "/");
}

std::string container_cache::lookup(const browse_path& path) const
{
    return find(key(path)).value_or("0");
}

std::optional<std::string> container_cache::find(const std::string& key) const
{
    auto it = m_ids.find(key);
    if(it == m_ids.end())
        return std::nullopt;
    return it->second;
}

bool container_cache::remember(const std::string& key, const std::string& id)
{
    return m_ids.emplace(key, id).second;
}

void container_cache::reset()
{
    m_ids.clear();
    m_ids.emplace("", "0");
}

static directory_entry synthetic_container(std::string name)
{
    directory_entry entry;
    entry.name = std::move(name);
    entry.is_container = true;
    return entry;
}

// Looks for an object key anywhere in the document
static bool has_key(const json& node, const std::string& key)
{
    if(node.is_object())
    {
        if(node.contains(key))
            return true;
        for(const auto& it : node.items())
        {
            if(has_key(it.value(), key))
                return true;
        }
    }
    else if(node.is_array())
    {
        for(const auto& it : node)
        {
            if(has_key(it, key))
                return true;
        }
    }
    return false;
}

std::vector<directory_entry> parse_json_directory(std::string_view body)
{
    std::vector<directory_entry> entries;

    bool plex = body.find("\"MediaContainer\"") != std::string_view::npos;
    bool items = body.find("\"Items\"") != std::string_view::npos;
    if(!plex && !items)
    {
        // Keys written with escape sequences only show up after parsing
        try {
            json parsed = json::parse(body.begin(), body.end());
            plex = has_key(parsed, "MediaContainer");
            items = has_key(parsed, "Items");
        } catch(const json::parse_error&) {
            // Neither json nor a json fragment, the html scraper gets it
        }
    }

    if(plex)
        entries.push_back(synthetic_container("Plex Media Server"));
    else if(items)
        entries.push_back(synthetic_container("Media Library"));
    return entries;
}

// Value of the href attribute of the anchor tag starting at tag, empty if there is none
static std::string_view href_value(std::string_view tag)
{
    std::string lower = utils::to_lower(tag);
    size_t pos = lower.find("href");
    if(pos == std::string::npos)
        return {};

    pos = tag.find('=', pos + 4);
    if(pos == std::string_view::npos)
        return {};
    tag = utils::trim(tag.substr(pos + 1));
    if(tag.empty())
        return {};

    if(tag.front() == '"' || tag.front() == '\'')
    {
        size_t end = tag.find(tag.front(), 1);
        if(end == std::string_view::npos)
            return {};
        return tag.substr(1, end - 1);
    }

    return tag.substr(0, tag.find_first_of(" \t\r\n>"));
}

std::vector<directory_entry> parse_html_directory(std::string_view html, const std::string& page_url)
{
    std::vector<directory_entry> entries;

    std::string directory_url = page_url;
    if(directory_url.empty() || directory_url.back() != '/')
        directory_url.push_back('/');

    const std::string lower = utils::to_lower(html);
    size_t pos = 0;
    while((pos = lower.find("<a", pos)) != std::string::npos)
    {
        size_t tag_end = lower.find('>', pos);
        if(tag_end == std::string::npos)
            break;

        // "<abbr>" and friends
        char next = lower[pos + 2];
        if(next != ' ' && next != '\t' && next != '\r' && next != '\n')
        {
            pos = tag_end;
            continue;
        }

        std::string_view tag = html.substr(pos, tag_end - pos);
        size_t close = lower.find("</a>", tag_end);
        std::string_view text = html.substr(tag_end + 1, (close == std::string::npos ? lower.size() : close) - tag_end - 1);
        pos = tag_end;

        std::string href {utils::trim(href_value(tag))};
        if(href.empty() || href.front() == '?' || href.front() == '#')
            continue;
        if(utils::contains_icase(text, "Parent Directory"))
            continue;

        bool is_directory = href.back() == '/';

        std::string_view segment {href};
        segment = segment.substr(0, segment.find_first_of("?#"));
        while(!segment.empty() && segment.back() == '/')
            segment.remove_suffix(1);
        segment = segment.substr(segment.rfind('/') == std::string_view::npos ? 0 : segment.rfind('/') + 1);

        std::string name = utils::percent_decode(segment);
        if(name.empty() || name == ".." || name == ".")
            continue;

        directory_entry entry;
        entry.name = std::move(name);
        entry.is_container = is_directory;
        if(!is_directory)
            entry.url = utils::resolve_url(directory_url, href);
        entries.push_back(std::move(entry));
    }

    return entries;
}

content_browser::content_browser(const http::client& client, const utils::logger& log, config::browse_settings settings)
    : m_client {client},
      m_log {log},
      m_settings {std::move(settings)}
{}

std::vector<directory_entry> content_browser::browse(const discovery::device& dev, const browse_path& path, container_cache& cache) const
{
    const std::string where = path.empty() ? std::string {"/"} : container_cache::key(path);

    if(const auto& control_url = dev.get_content_directory_url())
    {
        if(auto entries = browse_content_directory(*control_url, path, cache))
        {
            m_log.info(utils::log_category::soap, "Browsed {} of {}: {} entries", where, dev.get_name(), entries->size());
            return std::move(*entries);
        }
        m_log.info(utils::log_category::soap, "ContentDirectory of {} failed, trying http", dev.get_name());
    }

    if(auto entries = browse_http(dev.get_base_url(), path))
    {
        m_log.info(utils::log_category::http, "Browsed {} of {} over http: {} entries", where, dev.get_name(), entries->size());
        return std::move(*entries);
    }

    m_log.error(utils::log_category::app, "Nothing to browse at {} of {}", where, dev.get_name());
    throw browse_error {"no browsable content found"};
}

std::optional<std::vector<directory_entry>> content_browser::browse_content_directory(const std::string& control_url,
    const browse_path& path, container_cache& cache) const
{
    const std::string object_id = cache.lookup(path);
    m_log.debug(utils::log_category::soap, "Browse {} object {}", control_url, object_id);

    std::vector<didl_object> objects;
    try {
        http::response res = m_client.post(control_url, {
                {"Content-Type", "text/xml; charset=utf-8"},
                {"SOAPAction", browse_action}
            },
            build_browse_request(object_id, m_settings.requested_count),
            m_settings.soap_timeout);

        if(!res.ok())
        {
            m_log.warn(utils::log_category::soap, "Browse {} answered with status {}", control_url, res.get_code());
            return std::nullopt;
        }
        if(is_soap_fault(res.get_body()))
        {
            m_log.warn(utils::log_category::soap, "Browse {} answered with a soap fault", control_url);
            return std::nullopt;
        }

        objects = parse_browse_response(res.get_body());
    } catch(const http::transport_error& e) {
        m_log.warn(utils::log_category::net, "Browse {} failed: {}", control_url, e.what());
        return std::nullopt;
    } catch(const std::invalid_argument& e) {
        m_log.warn(utils::log_category::http, "Browse {} sent an invalid response: {}", control_url, e.what());
        return std::nullopt;
    } catch(const rapidxml::parse_error& e) {
        m_log.warn(utils::log_category::xml, "Browse response of {} is not valid xml: {}", control_url, e.what());
        return std::nullopt;
    }

    const std::string parent = container_cache::key(path);
    std::vector<directory_entry> entries;
    entries.reserve(objects.size());
    for(auto& obj : objects)
    {
        if(obj.entry.is_container)
        {
            std::string child = parent.empty() ? obj.entry.name : parent + "/" + obj.entry.name;
            std::string id = obj.id.empty() ? child : obj.id;
            if(cache.remember(child, id))
                m_log.debug(utils::log_category::soap, "Container {} has id {}", child, id);
        }
        entries.push_back(std::move(obj.entry));
    }

    return entries;
}

std::optional<std::vector<directory_entry>> content_browser::browse_http(const std::string& base_url, const browse_path& path) const
{
    std::vector<std::string> endpoints;
    if(path.empty())
    {
        endpoints = root_endpoints;
    }
    else
    {
        std::vector<std::string> segments;
        for(const auto& segment : path)
            segments.push_back(utils::percent_encode(segment));
        endpoints.push_back("/" + utils::join(segments, "/"));
    }

    for(const auto& endpoint : endpoints)
    {
        const std::string url = base_url + endpoint;
        try {
            http::response res = m_client.get(url, m_settings.http_timeout);
            if(!res.ok())
            {
                m_log.debug(utils::log_category::http, "{} answered with status {}", url, res.get_code());
                continue;
            }

            std::vector<directory_entry> entries = parse_http_listing(res, url);
            if(!entries.empty())
                return entries;
            m_log.debug(utils::log_category::http, "{} has no recognisable entries", url);
        } catch(const http::transport_error& e) {
            m_log.debug(utils::log_category::net, "{}: {}", url, e.what());
        } catch(const std::invalid_argument& e) {
            m_log.debug(utils::log_category::http, "{} sent an invalid response: {}", url, e.what());
        }
    }

    return std::nullopt;
}

std::vector<directory_entry> content_browser::parse_http_listing(const http::response& res, const std::string& page_url) const
{
    std::vector<directory_entry> entries = parse_json_directory(res.get_body());
    if(!entries.empty())
        return entries;
    return parse_html_directory(res.get_body(), page_url);
}

} // namespace upnp
