#include "logger.hpp"

#include "fmt/chrono.h"

#include <ctime>

namespace utils
{

const char* to_string(log_severity severity)
{
    switch(severity)
    {
        case log_severity::error:
            return "ERROR";
        case log_severity::warn:
            return "WARN";
        case log_severity::info:
            return "INFO";
        case log_severity::debug:
            return "DEBUG";
        case log_severity::trace:
            return "TRACE";
    }
    return "";
}

const char* to_string(log_category category)
{
    switch(category)
    {
        case log_category::net:
            return "NET";
        case log_category::disc:
            return "DISC";
        case log_category::soap:
            return "SOAP";
        case log_category::http:
            return "HTTP";
        case log_category::xml:
            return "XML";
        case log_category::app:
            return "APP";
    }
    return "";
}

std::string log_entry::format_line() const
{
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%H:%M:%S} [{}] {:5} {}", fmt::localtime(t), to_string(category), to_string(severity), message);
}

logger::logger(std::FILE* out, log_severity level, size_t capacity)
    : m_out {out},
      m_level {level},
      m_capacity {capacity}
{}

logger::logger(const std::string& path, log_severity level, size_t capacity)
    : m_out {std::fopen(path.c_str(), "a")},
      m_owns_out {true},
      m_level {level},
      m_capacity {capacity}
{
    if(!m_out)
    {
        m_out = stderr;
        m_owns_out = false;
    }
}

logger::~logger()
{
    if(m_owns_out)
        std::fclose(m_out);
}

void logger::write(log_severity severity, log_category category, std::string message) const
{
    log_entry entry {std::chrono::system_clock::now(), category, severity, std::move(message)};

    std::lock_guard<std::mutex> lock {m_mutex};
    if(m_out && severity <= m_level)
    {
        fmt::print(m_out, "{}\n", entry.format_line());
        std::fflush(m_out);
    }

    if(m_capacity == 0)
        return;
    if(m_entries.size() >= m_capacity)
        m_entries.pop_front();
    m_entries.push_back(std::move(entry));
}

std::vector<log_entry> logger::entries() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return std::vector<log_entry> {m_entries.begin(), m_entries.end()};
}

void logger::set_level(log_severity level)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_level = level;
}

log_severity logger::level() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_level;
}

} // namespace utils
