#ifndef MOP_DISCOVERY_MANAGER_HPP
#define MOP_DISCOVERY_MANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <future>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "config.hpp"
#include "device.hpp"
#include "device_source.hpp"
#include "event_queue.hpp"
#include "logger.hpp"

namespace discovery
{

using run_id = uint64_t;

struct discovery_started
{
    run_id run;
};

struct device_found
{
    run_id run;
    device dev;
};

struct discovery_error
{
    run_id run;
    std::string message;
};

struct discovery_completed
{
    run_id run;
    size_t device_count;
};

using discovery_event = std::variant<discovery_started, device_found, discovery_error, discovery_completed>;

using event_sink = event_queue<discovery_event>;

/// Runs the device sources one after another and reports everything through the event sink.
/// A run emits started, one device_found per new location, the collected soft errors and exactly one completed.
class discovery_manager
{
public:

    discovery_manager(const discovery_manager&) = delete;
    discovery_manager& operator=(const discovery_manager&) = delete;
    discovery_manager(discovery_manager&&) = delete;
    discovery_manager& operator=(discovery_manager&&) = delete;

    /// Sources are queried in the given order, later sources skip locations found by earlier ones
    discovery_manager(std::vector<std::unique_ptr<device_source>> sources, event_sink& sink, const utils::logger& log,
        std::chrono::milliseconds refresh_interval = std::chrono::milliseconds {REFRESH_INTERVAL});

    /// Waits for all runs which are still in flight
    ~discovery_manager();

    /// One run on the calling thread
    run_id run();

    /// One run on a background thread, returns immediately
    run_id start();

    /// Starts a new run if the last one was started at least one refresh interval ago
    bool refresh_if_due();

    /// Number of background runs that have not finished yet
    size_t pending() const;

private:

    /// Caller holds m_mutex
    run_id start_locked();

    void execute(run_id run);

    void emit(discovery_event event);

    std::vector<std::unique_ptr<device_source>> m_sources;

    event_sink& m_sink;

    const utils::logger& m_log;

    std::chrono::milliseconds m_refresh_interval;

    std::atomic<run_id> m_next_run {1};

    mutable std::mutex m_mutex;

    std::vector<std::future<void>> m_runs;

    std::chrono::steady_clock::time_point m_last_start;

    bool m_ever_started = false;

};

} // namespace discovery

#endif
