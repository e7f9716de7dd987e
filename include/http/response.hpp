#ifndef MOP_HTTP_RESPONSE_HPP
#define MOP_HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <map>

namespace http
{

/// Response received from a server. Header names are stored lower case.
class response
{
public:

    response() = default;

    /// Throws std::invalid_argument if raw does not start with a valid status line
    explicit response(std::string_view raw);

    void parse(std::string_view raw);

    /// Number of bytes a complete message needs, 0 if that can not be told yet (no header end or no length)
    static size_t expected_size(std::string_view partial);

    void set_code(int code)
    {
        m_code = code;
    }

    void set_code(int code, std::string&& phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    void set_header(const std::string& key, const std::string& value);

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const std::string& get_body() const
    {
        return m_body;
    }

    bool ok() const
    {
        return m_code == 200;
    }

private:

    int m_code = 0;
    std::string m_phrase;
    std::string m_body;

    std::map<std::string, std::string> m_headers;

};

} // namespace http

#endif
