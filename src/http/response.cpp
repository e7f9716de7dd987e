#include <http/response.hpp>

#include "utils.hpp"

#include <charconv>
#include <stdexcept>

namespace http
{

static size_t find_header_end(std::string_view raw, size_t& separator_len)
{
    size_t pos = raw.find("\r\n\r\n");
    separator_len = 4;
    if(pos == std::string_view::npos)
    {
        pos = raw.find("\n\n");
        separator_len = 2;
    }
    return pos;
}

static std::string decode_chunked(std::string_view body)
{
    std::string decoded;
    while(!body.empty())
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            throw std::invalid_argument {"Truncated chunk header"};

        // Chunk extensions follow a semicolon
        std::string_view size_view = utils::trim(body.substr(0, body.substr(0, endl).find(';')));
        size_t chunk_size = 0;
        auto res = std::from_chars(size_view.data(), size_view.data() + size_view.size(), chunk_size, 16);
        if(res.ec != std::errc {})
            throw std::invalid_argument {"Invalid chunk size"};

        body.remove_prefix(endl + 2);
        if(chunk_size == 0)
            break;
        if(chunk_size > body.size())
            throw std::invalid_argument {"Truncated chunk"};

        decoded.append(body.substr(0, chunk_size));
        body.remove_prefix(chunk_size);
        if(body.substr(0, 2) == "\r\n")
            body.remove_prefix(2);
    }
    return decoded;
}

response::response(std::string_view raw)
{
    parse(raw);
}

void response::parse(std::string_view raw)
{
    m_headers.clear();
    m_body.clear();

    /* Parse status line */
    size_t endl = raw.find('\n');
    std::string_view status_line = utils::trim(raw.substr(0, endl));
    if(status_line.rfind("HTTP/", 0) != 0)
        throw std::invalid_argument {"invalid_statusline"};

    size_t code_start = status_line.find(' ');
    if(code_start == std::string_view::npos)
        throw std::invalid_argument {"invalid_statusline"};
    std::string_view rest = status_line.substr(code_start + 1);
    std::string_view code_view = rest.substr(0, rest.find(' '));

    int code = 0;
    auto res = std::from_chars(code_view.data(), code_view.data() + code_view.size(), code);
    if(res.ec != std::errc {} || code < 100 || code > 999)
        throw std::invalid_argument {"invalid_statuscode"};
    m_code = code;
    m_phrase = (code_view.size() < rest.size()) ? std::string {utils::trim(rest.substr(code_view.size()))} : "";

    if(endl == std::string_view::npos)
        return;

    /* Read headers until the empty line */
    size_t separator_len;
    size_t header_end = find_header_end(raw, separator_len);
    std::string_view header_block = (header_end == std::string_view::npos) ?
        raw.substr(endl + 1) : raw.substr(endl + 1, (header_end > endl) ? header_end - endl - 1 : 0);

    while(!header_block.empty())
    {
        size_t line_end = header_block.find('\n');
        std::string_view headerline = header_block.substr(0, line_end);
        header_block = (line_end == std::string_view::npos) ? std::string_view {} : header_block.substr(line_end + 1);

        size_t sep = headerline.find(':');
        if(sep == std::string_view::npos)
            continue;

        std::string key = utils::to_lower(utils::trim(headerline.substr(0, sep)));
        std::string_view value = utils::trim(headerline.substr(sep + 1));
        m_headers[key] = std::string {value};
    }

    if(header_end == std::string_view::npos)
        return;

    /* Body */
    std::string_view body = raw.substr(header_end + separator_len);
    if(utils::contains_icase(get_header("Transfer-Encoding"), "chunked"))
    {
        m_body = decode_chunked(body);
    }
    else if(check_header("Content-Length"))
    {
        std::string length_view = get_header("Content-Length");
        size_t length = 0;
        auto len_res = std::from_chars(length_view.data(), length_view.data() + length_view.size(), length);
        if(len_res.ec == std::errc {} && length < body.size())
            body = body.substr(0, length);
        m_body = std::string {body};
    }
    else
    {
        m_body = std::string {body};
    }
}

size_t response::expected_size(std::string_view partial)
{
    size_t separator_len;
    size_t header_end = find_header_end(partial, separator_len);
    if(header_end == std::string_view::npos)
        return 0;

    response head;
    try {
        head.parse(partial.substr(0, header_end + separator_len));
    } catch(const std::invalid_argument&) {
        return 0;
    }

    if(utils::contains_icase(head.get_header("Transfer-Encoding"), "chunked"))
    {
        std::string_view tail = partial.substr(header_end + separator_len);
        return (tail.size() >= 5 && tail.substr(tail.size() - 5) == "0\r\n\r\n") ? partial.size() : 0;
    }

    // Responses without body
    if(head.get_code() == 204 || head.get_code() == 304 || (head.get_code() >= 100 && head.get_code() < 200))
        return header_end + separator_len;

    std::string length_view = head.get_header("Content-Length");
    size_t length = 0;
    auto res = std::from_chars(length_view.data(), length_view.data() + length_view.size(), length);
    if(length_view.empty() || res.ec != std::errc {})
        return 0;

    return header_end + separator_len + length;
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[utils::to_lower(key)] = value;
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

bool response::check_header(const std::string& key) const
{
    return m_headers.find(utils::to_lower(key)) != m_headers.end();
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(utils::to_lower(key));
    return (it != m_headers.end()) ? it->second : std::string {};
}

} // namespace http
