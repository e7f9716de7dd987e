#include "http/request.hpp"

#include <stdexcept>

namespace http
{

request::request(std::string method, const std::string& target)
    : m_method {std::move(method)},
      m_target {utils::parse_url(target)}
{
    if(m_target.scheme != "http")
        throw std::invalid_argument {"Only plain http is supported: " + target};
}

std::string request::to_string() const
{
    std::string request {m_method};
    ((request += " ") += m_target.path) += " HTTP/1.1\r\n";

    // Default port is left out of the host header
    if(m_target.port == 80)
        ((request += "Host: ") += m_target.host) += "\r\n";
    else
        ((((request += "Host: ") += m_target.host) += ":") += std::to_string(m_target.port)) += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    if(!check_header("User-Agent"))
        request += "User-Agent: mop/1.0\r\n";
    if(!check_header("Connection"))
        request += "Connection: close\r\n";
    if(!m_body.empty() || m_method == "POST")
        ((request += "Content-Length: ") += std::to_string(m_body.size())) += "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

void request::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

bool request::check_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    if(it == m_headers.end())
        return false;
    else
        return true;
}

std::string request::get_header(const std::string& key) const
{
    try {
        return m_headers.at(key);
    } catch(std::out_of_range& e) {
        return "";
    }
}

} // namespace http
