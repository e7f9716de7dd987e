#include <cstdlib>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <variant>

#include "fmt/format.h"

#include "config.hpp"
#include "content_browser.hpp"
#include "discovery_manager.hpp"
#include "http/client.hpp"
#include "logger.hpp"
#include "port_scan.hpp"
#include "ssdp_discovery.hpp"

#define LOG_FILE "mop.log"

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

static const char* origin_label(discovery::device_origin origin)
{
    return (origin == discovery::device_origin::ssdp) ? "ssdp" : "scan";
}

// Prints events until the run is completed and returns the devices it found
static std::vector<discovery::device> collect_devices(discovery::event_sink& events, discovery::run_id run)
{
    std::vector<discovery::device> devices;
    bool done = false;
    while(!done)
    {
        discovery::discovery_event event = events.pop();
        std::visit(overloaded {
            [run](const discovery::discovery_started& e) {
                if(e.run == run)
                    fmt::print("Scanning network for media devices...\n");
            },
            [run, &devices](const discovery::device_found& e) {
                if(e.run != run)
                    return;
                for(const auto& known : devices)
                {
                    if(known == e.dev)
                        return;
                }
                fmt::print("  found {} [{}]\n", e.dev.get_name(), origin_label(e.dev.get_origin()));
                devices.push_back(e.dev);
            },
            [run](const discovery::discovery_error& e) {
                if(e.run == run)
                    fmt::print("  error: {}\n", e.message);
            },
            [run, &done](const discovery::discovery_completed& e) {
                if(e.run == run)
                    done = true;
            }
        }, event);
    }
    return devices;
}

static const discovery::device& select_device(const std::vector<discovery::device>& devices)
{
    fmt::print("Detected {} device(s) in your local network.\n-------------------------------\n", devices.size());
    for(size_t i = 0; i < devices.size(); i++)
    {
        fmt::print("{} | {}\n", i, devices[i].get_name());
        fmt::print("    {}\n", devices[i].get_location());
    }
    fmt::print("\nSelect the device you want to browse:\n>> ");

    size_t selected = 0;
    if(!(std::cin >> selected) || selected >= devices.size())
        selected = 0; // Default selection
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

    return devices[selected];
}

static void print_entries(const std::vector<upnp::directory_entry>& entries)
{
    for(size_t i = 0; i < entries.size(); i++)
    {
        const auto& entry = entries[i];
        fmt::print("{:>3} | {}{}", i, entry.name, entry.is_container ? "/" : "");
        if(entry.metadata && entry.metadata->format)
            fmt::print("  ({})", *entry.metadata->format);
        fmt::print("\n");
        if(entry.url)
            fmt::print("      {}\n", *entry.url);
    }
}

static void print_errors(const utils::logger& log)
{
    for(const auto& entry : log.entries())
    {
        if(entry.severity <= utils::log_severity::warn)
            fmt::print("{}\n", entry.format_line());
    }
}

static void browse_device(const upnp::content_browser& browser, const discovery::device& dev, const utils::logger& log)
{
    upnp::container_cache cache;
    upnp::browse_path path;

    std::string line;
    while(true)
    {
        fmt::print("\n{}:/{}\n", dev.get_name(), upnp::container_cache::key(path));

        std::vector<upnp::directory_entry> entries;
        try {
            entries = browser.browse(dev, path, cache);
            print_entries(entries);
        } catch(const upnp::browse_error& e) {
            fmt::print("Browsing failed: {}\n", e.what());
        }

        fmt::print("\nIndex to open, '..' to go up, 'e' for errors, 'q' to quit:\n>> ");
        if(!std::getline(std::cin, line) || line == "q")
            return;

        if(line == "..")
        {
            if(!path.empty())
                path.pop_back();
        }
        else if(line == "e")
        {
            print_errors(log);
        }
        else
        {
            size_t index = 0;
            try {
                index = std::stoul(line);
            } catch(const std::logic_error&) {
                fmt::print("Unknown command {}\n", line);
                continue;
            }

            if(index >= entries.size())
                fmt::print("No entry {}\n", index);
            else if(!entries[index].is_container)
                fmt::print("{}\n", entries[index].url.value_or("No playable url"));
            else
                path.push_back(entries[index].name);
        }
    }
}

int main()
{
    utils::logger log {std::string {LOG_FILE}};
    log.info(utils::log_category::app, "Starting");

    config::discovery_settings settings;
    config::browse_settings browse_settings;

    http::tcp_client client {log};

    std::vector<std::unique_ptr<discovery::device_source>> sources;
    sources.push_back(std::make_unique<discovery::ssdp_prober>(client, log, settings.ssdp));
    sources.push_back(std::make_unique<discovery::port_scanner>(client, log, settings.scan));

    discovery::event_sink events {settings.queue_capacity};
    discovery::discovery_manager manager {std::move(sources), events, log, settings.refresh_interval};

    discovery::run_id run = manager.start();
    std::vector<discovery::device> devices = collect_devices(events, run);
    if(devices.empty())
    {
        fmt::print("No devices found\n");
        print_errors(log);
        return EXIT_SUCCESS;
    }

    const discovery::device& dev = select_device(devices);
    log.info(utils::log_category::app, "Browsing {}", dev.get_name());

    upnp::content_browser browser {client, log, browse_settings};
    browse_device(browser, dev, log);

    return EXIT_SUCCESS;
}
