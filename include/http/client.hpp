#ifndef MOP_HTTP_CLIENT_HPP
#define MOP_HTTP_CLIENT_HPP

#include <string>
#include <map>
#include <chrono>
#include <stdexcept>

#include "http/request.hpp"
#include "http/response.hpp"
#include "logger.hpp"

namespace http
{

/// Socket, connect, send and receive failures including timeouts
class transport_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// Peer could not be reached at all
class connect_error : public transport_error
{
public:
    using transport_error::transport_error;
};

class client
{
public:

    virtual ~client() = default;

    /// Sends the request and waits at most timeout for the complete response.
    /// Throws transport_error (or connect_error) on failure and std::invalid_argument on unparsable responses.
    virtual response perform(const request& req, std::chrono::milliseconds timeout) const = 0;

    response get(const std::string& url, std::chrono::milliseconds timeout) const;

    response post(const std::string& url, const std::map<std::string, std::string>& headers, std::string body, std::chrono::milliseconds timeout) const;

};

/// Blocking client on top of plain POSIX sockets. Connect and every read are bounded by the deadline.
class tcp_client : public client
{
public:

    explicit tcp_client(const utils::logger& log)
        : m_log {log}
    {}

    response perform(const request& req, std::chrono::milliseconds timeout) const override;

private:

    const utils::logger& m_log;

};

} // namespace http

#endif
