#ifndef MOP_HTTP_REQUEST_HPP
#define MOP_HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <map>

#include "utils.hpp"

namespace http {

/// Outgoing HTTP/1.1 request. The connection is always closed after the response.
class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    /// Throws std::invalid_argument if target is not an absolute http url
    request(std::string method, const std::string& target);

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    void set_body(std::string body) { m_body = std::move(body); }

    const std::string& get_body() const { return m_body; }

    const std::string& get_method() const { return m_method; }

    const utils::url& get_target() const { return m_target; }

    std::string get_url() const { return m_target.origin() + m_target.path; }

private:

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    utils::url m_target;      /// host, port and path the request is sent to

    std::map<std::string, std::string> m_headers; /// contains names and values of the http request headers
    std::string m_body;

};

} // namespace http

#endif
