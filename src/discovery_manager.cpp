#include "discovery_manager.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <stdexcept>

using namespace std::chrono;

namespace discovery
{

discovery_manager::discovery_manager(std::vector<std::unique_ptr<device_source>> sources, event_sink& sink,
    const utils::logger& log, milliseconds refresh_interval)
    : m_sources {std::move(sources)},
      m_sink {sink},
      m_log {log},
      m_refresh_interval {refresh_interval}
{}

discovery_manager::~discovery_manager()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    for(auto& pending_run : m_runs)
        pending_run.wait();
}

run_id discovery_manager::run()
{
    run_id id = m_next_run++;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_last_start = steady_clock::now();
        m_ever_started = true;
    }

    execute(id);
    return id;
}

run_id discovery_manager::start()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return start_locked();
}

run_id discovery_manager::start_locked()
{
    run_id id = m_next_run++;
    m_last_start = steady_clock::now();
    m_ever_started = true;

    // Forget runs which are done already
    m_runs.erase(std::remove_if(m_runs.begin(), m_runs.end(), [](const std::future<void>& f) {
        return f.wait_for(seconds {0}) == std::future_status::ready;
    }), m_runs.end());

    m_runs.push_back(std::async(std::launch::async, &discovery_manager::execute, this, id));
    return id;
}

bool discovery_manager::refresh_if_due()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    if(m_ever_started && steady_clock::now() - m_last_start < m_refresh_interval)
        return false;

    m_log.debug(utils::log_category::disc, "Refreshing device list");
    start_locked();
    return true;
}

size_t discovery_manager::pending() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return std::count_if(m_runs.begin(), m_runs.end(), [](const std::future<void>& f) {
        return f.wait_for(seconds {0}) != std::future_status::ready;
    });
}

void discovery_manager::emit(discovery_event event)
{
    m_sink.push(std::move(event));
}

void discovery_manager::execute(run_id run)
{
    m_log.info(utils::log_category::disc, "Discovery run {} started", run);
    emit(discovery_started {run});

    location_set seen;
    size_t found = 0;
    std::vector<std::string> errors;

    auto report = [&](const device& dev) {
        if(!seen.insert(dev.get_location()).second)
            return;
        ++found;
        m_log.info(utils::log_category::disc, "Found {} at {}", dev.get_name(), dev.get_location());
        emit(device_found {run, dev});
    };

    for(const auto& source : m_sources)
    {
        discovery_result result;
        try {
            result = source->discover(seen, report);
        } catch(const std::runtime_error& e) {
            result.errors.push_back(fmt::format("{} failed: {}", source->get_name(), e.what()));
        }

        // Sources that only return their devices are reported here
        for(const auto& dev : result.devices)
            report(dev);

        for(auto& error : result.errors)
        {
            m_log.warn(utils::log_category::disc, "{}: {}", source->get_name(), error);
            errors.push_back(std::move(error));
        }
    }

    for(auto& error : errors)
        emit(discovery_error {run, std::move(error)});

    m_log.info(utils::log_category::disc, "Discovery run {} complete: found {} devices", run, found);
    emit(discovery_completed {run, found});
}

} // namespace discovery
