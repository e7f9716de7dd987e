#include "http/client.hpp"

#include "fmt/format.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

using namespace std::chrono;

namespace http
{

namespace
{

// Owns a socket file descriptor
class socket_handle
{
public:

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;
    socket_handle& operator=(socket_handle&&) = delete;

    socket_handle(socket_handle&& other) noexcept
        : m_fd {other.m_fd}
    {
        other.m_fd = -1;
    }

    explicit socket_handle(int fd)
        : m_fd {fd}
    {}

    ~socket_handle()
    {
        if(m_fd >= 0)
            ::close(m_fd);
    }

    int get() const
    {
        return m_fd;
    }

private:

    int m_fd;

};

int remaining_ms(steady_clock::time_point deadline)
{
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return (left > 0) ? static_cast<int>(left) : 0;
}

// Waits for events on fd until the deadline. Returns false on timeout
bool wait_for(int fd, short events, steady_clock::time_point deadline)
{
    for(;;)
    {
        pollfd pfd {fd, events, 0};
        int ret = ::poll(&pfd, 1, remaining_ms(deadline));
        if(ret > 0)
            return true;
        if(ret == 0)
            return false;
        if(errno != EINTR)
            throw transport_error {fmt::format("poll failed: {}", std::strerror(errno))};
    }
}

socket_handle connect_with_deadline(const utils::url& target, steady_clock::time_point deadline)
{
    addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string host = target.host;
    if(host.size() > 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);

    addrinfo* result = nullptr;
    int ret = ::getaddrinfo(host.c_str(), std::to_string(target.port).c_str(), &hints, &result);
    if(ret != 0)
        throw connect_error {fmt::format("Can not resolve {}: {}", target.host, ::gai_strerror(ret))};

    std::string last_error {"no address"};
    for(addrinfo* addr = result; addr != nullptr; addr = addr->ai_next)
    {
        int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
        if(fd < 0)
        {
            last_error = std::strerror(errno);
            continue;
        }
        socket_handle sock {fd};

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        if(::connect(fd, addr->ai_addr, addr->ai_addrlen) != 0 && errno != EINPROGRESS)
        {
            last_error = std::strerror(errno);
            continue;
        }

        if(!wait_for(fd, POLLOUT, deadline))
        {
            last_error = "connect timed out";
            continue;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if(so_error != 0)
        {
            last_error = std::strerror(so_error);
            continue;
        }

        ::freeaddrinfo(result);
        return sock;
    }

    ::freeaddrinfo(result);
    throw connect_error {fmt::format("Can not connect to {}:{}: {}", target.host, target.port, last_error)};
}

} // namespace

response client::get(const std::string& url, milliseconds timeout) const
{
    request req {"GET", url};
    return perform(req, timeout);
}

response client::post(const std::string& url, const std::map<std::string, std::string>& headers, std::string body, milliseconds timeout) const
{
    request req {"POST", url};
    for(const auto& it : headers)
        req.set_header(it.first, it.second);
    req.set_body(std::move(body));
    return perform(req, timeout);
}

response tcp_client::perform(const request& req, milliseconds timeout) const
{
    const auto deadline = steady_clock::now() + timeout;
    const utils::url& target = req.get_target();
    if(target.scheme != "http")
        throw std::invalid_argument {fmt::format("Scheme {} is not supported", target.scheme)};

    m_log.debug(utils::log_category::http, "{} {}", req.get_method(), req.get_url());

    socket_handle sock = connect_with_deadline(target, deadline);

    // Send the full request
    std::string req_str = req.to_string();
    size_t sent = 0;
    while(sent < req_str.size())
    {
        if(!wait_for(sock.get(), POLLOUT, deadline))
            throw transport_error {fmt::format("Sending to {} timed out", req.get_url())};

        ssize_t n = ::send(sock.get(), req_str.data() + sent, req_str.size() - sent, MSG_NOSIGNAL);
        if(n < 0)
        {
            if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            throw transport_error {fmt::format("Sending to {} failed: {}", req.get_url(), std::strerror(errno))};
        }
        sent += static_cast<size_t>(n);
    }

    // Receive until the peer closes or the announced length is complete
    std::string raw;
    std::array<char, 4096> buffer;
    for(;;)
    {
        size_t expected = response::expected_size(raw);
        if(expected > 0 && raw.size() >= expected)
            break;

        if(!wait_for(sock.get(), POLLIN, deadline))
            throw transport_error {fmt::format("Reading from {} timed out", req.get_url())};

        ssize_t br = ::recv(sock.get(), buffer.data(), buffer.size(), 0);
        if(br == 0)
            break;
        if(br < 0)
        {
            if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            throw transport_error {fmt::format("Reading from {} failed: {}", req.get_url(), std::strerror(errno))};
        }
        raw.append(buffer.data(), static_cast<size_t>(br));
    }

    if(raw.empty())
        throw transport_error {fmt::format("Empty response from {}", req.get_url())};

    response res {raw};
    m_log.debug(utils::log_category::http, "{} {} -> {} ({} bytes)", req.get_method(), req.get_url(), res.get_code(), res.get_body().size());
    return res;
}

} // namespace http
