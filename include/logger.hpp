#ifndef MOP_LOGGER_HPP
#define MOP_LOGGER_HPP

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <cstdio>
#include <utility>

#include "fmt/format.h"

#include "config.hpp"

namespace utils
{

enum class log_severity
{
    error,
    warn,
    info,
    debug,
    trace
};

enum class log_category
{
    net,
    disc,
    soap,
    http,
    xml,
    app
};

const char* to_string(log_severity severity);

const char* to_string(log_category category);

struct log_entry
{
    std::chrono::system_clock::time_point timestamp;
    log_category category;
    log_severity severity;
    std::string message;

    // HH:MM:SS [CAT] SEVERITY message
    std::string format_line() const;
};

/// Thread safe log sink which is handed to every component that wants to log.
/// Lines at or above the output level go to the output stream, every line ends up in the ring buffer.
class logger
{
public:

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger(logger&&) = delete;
    logger& operator=(logger&&) = delete;

    explicit logger(std::FILE* out = stderr, log_severity level = log_severity::info, size_t capacity = LOG_BUFFER_CAPACITY);

    /// Appends to the file at path. Falls back to stderr if the file can not be opened
    explicit logger(const std::string& path, log_severity level = log_severity::debug, size_t capacity = LOG_BUFFER_CAPACITY);

    ~logger();

    template<typename... Args>
    void log(log_severity severity, log_category category, fmt::format_string<Args...> format, Args&&... args) const
    {
        write(severity, category, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(log_category category, fmt::format_string<Args...> format, Args&&... args) const
    {
        write(log_severity::error, category, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(log_category category, fmt::format_string<Args...> format, Args&&... args) const
    {
        write(log_severity::warn, category, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(log_category category, fmt::format_string<Args...> format, Args&&... args) const
    {
        write(log_severity::info, category, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(log_category category, fmt::format_string<Args...> format, Args&&... args) const
    {
        write(log_severity::debug, category, fmt::format(format, std::forward<Args>(args)...));
    }

    void write(log_severity severity, log_category category, std::string message) const;

    std::vector<log_entry> entries() const;

    void set_level(log_severity level);

    log_severity level() const;

private:

    std::FILE* m_out;

    bool m_owns_out = false;

    log_severity m_level;

    size_t m_capacity;

    mutable std::deque<log_entry> m_entries;

    mutable std::mutex m_mutex;

};

} // namespace utils

#endif
