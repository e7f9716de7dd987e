#ifndef MOP_TESTS_FAKE_CLIENT_HPP
#define MOP_TESTS_FAKE_CLIENT_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>

#include "http/client.hpp"

namespace mop_test
{

struct recorded_request
{
    std::string method;
    std::string url;
    std::string body;
    std::string raw;
};

/// Serves canned responses keyed by method and url. Unknown urls fail like an unreachable host.
class fake_client : public http::client
{
public:

    void respond(const std::string& method, const std::string& url, int code, std::string body)
    {
        http::response res;
        res.set_code(code);
        res.set_body(std::move(body));
        m_routes[method + " " + url] = route {res, false};
    }

    void on_get(const std::string& url, int code, std::string body)
    {
        respond("GET", url, code, std::move(body));
    }

    void on_post(const std::string& url, int code, std::string body)
    {
        respond("POST", url, code, std::move(body));
    }

    // Connection is accepted but the answer never completes
    void time_out(const std::string& method, const std::string& url)
    {
        m_routes[method + " " + url] = route {http::response {}, true};
    }

    http::response perform(const http::request& req, std::chrono::milliseconds) const override
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_requests.push_back(recorded_request {req.get_method(), req.get_url(), req.get_body(), req.to_string()});

        auto it = m_routes.find(req.get_method() + " " + req.get_url());
        if(it == m_routes.end())
            throw http::connect_error {"Connection refused: " + req.get_url()};
        if(it->second.timeout)
            throw http::transport_error {"Reading from " + req.get_url() + " timed out"};
        return it->second.res;
    }

    std::vector<recorded_request> requests() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_requests;
    }

    size_t count(const std::string& method, const std::string& url) const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        size_t n = 0;
        for(const auto& req : m_requests)
        {
            if(req.method == method && req.url == url)
                ++n;
        }
        return n;
    }

private:

    struct route
    {
        http::response res;
        bool timeout;
    };

    std::map<std::string, route> m_routes;

    mutable std::vector<recorded_request> m_requests;

    mutable std::mutex m_mutex;

};

} // namespace mop_test

#endif
