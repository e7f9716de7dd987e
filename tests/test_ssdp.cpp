#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "fake_client.hpp"
#include "logger.hpp"
#include "ssdp_discovery.hpp"

using namespace std::chrono_literals;

namespace
{

const std::string sonos_response =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age = 1800\r\n"
    "EXT:\r\n"
    "LOCATION: http://10.0.0.5:1400/desc.xml\r\n"
    "SERVER: Linux/3.14 UPnP/1.0 Sonos/1.0\r\n"
    "ST: upnp:rootdevice\r\n"
    "USN: uuid:RINCON_000E58A0B1C201400::upnp:rootdevice\r\n"
    "\r\n";

const std::string media_server_description =
    "<?xml version=\"1.0\"?>"
    "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
    "<device>"
    "<deviceType>urn:schemas-upnp-org:device:MediaServer:1</deviceType>"
    "<friendlyName>NAS</friendlyName>"
    "<serviceList>"
    "<service>"
    "<serviceType>urn:schemas-upnp-org:service:ContentDirectory:1</serviceType>"
    "<serviceId>urn:upnp-org:serviceId:ContentDirectory</serviceId>"
    "<controlURL>/ctl/ContentDir</controlURL>"
    "</service>"
    "</serviceList>"
    "</device>"
    "</root>";

// Stands in for the multicast group on the loopback interface and answers from there
class loopback_responder
{
public:

    loopback_responder()
    {
        m_fd = ::socket(AF_INET, SOCK_DGRAM, 0);
        if(m_fd < 0)
            throw std::runtime_error {"Failed to create responder socket"};

        sockaddr_in addr {};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t len = sizeof(addr);
        if(::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        {
            ::close(m_fd);
            throw std::runtime_error {"Failed to bind responder socket"};
        }
        m_port = ntohs(addr.sin_port);
    }

    loopback_responder(const loopback_responder&) = delete;
    loopback_responder& operator=(const loopback_responder&) = delete;

    ~loopback_responder()
    {
        ::close(m_fd);
    }

    uint16_t port() const
    {
        return m_port;
    }

    /// Waits for the next M-SEARCH and returns where it came from
    std::optional<sockaddr_in> receive(std::chrono::milliseconds timeout, std::string* payload = nullptr)
    {
        pollfd pfd {m_fd, POLLIN, 0};
        if(::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
            return std::nullopt;

        char buffer[2048];
        sockaddr_in peer {};
        socklen_t len = sizeof(peer);
        ssize_t n = ::recvfrom(m_fd, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&peer), &len);
        if(n < 0)
            return std::nullopt;
        if(payload)
            payload->assign(buffer, static_cast<size_t>(n));
        return peer;
    }

    void reply(const sockaddr_in& peer, const std::string& msg)
    {
        ::sendto(m_fd, msg.data(), msg.size(), 0, reinterpret_cast<const sockaddr*>(&peer), sizeof(peer));
    }

private:

    int m_fd = -1;

    uint16_t m_port = 0;

};

std::string ssdp_answer(const std::string& location)
{
    return "HTTP/1.1 200 OK\r\n"
        "LOCATION: " + location + "\r\n"
        "SERVER: Linux UPnP/1.0 MiniDLNA/1.3\r\n"
        "ST: urn:schemas-upnp-org:device:MediaServer:1\r\n"
        "USN: uuid:4d696e69-444c-164e-9d41-b827eb0b1b3e::urn:schemas-upnp-org:device:MediaServer:1\r\n"
        "\r\n";
}

config::ssdp_settings loopback_settings(uint16_t port)
{
    config::ssdp_settings settings;
    settings.multicast_ip = "127.0.0.1";
    settings.multicast_port = port;
    settings.read_timeout = 300ms;
    settings.overall_timeout = 3s;
    return settings;
}

} // namespace

TEST(SsdpMessages, BuildsMSearch)
{
    config::ssdp_settings settings;
    EXPECT_EQ(discovery::build_msearch(settings, "upnp:rootdevice"),
        "M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\nMAN: \"ssdp:discover\"\r\nST: upnp:rootdevice\r\nMX: 3\r\n\r\n");
}

TEST(SsdpMessages, ParsesHeadersCaseInsensitive)
{
    auto res = discovery::parse_response(
        "HTTP/1.1 200 OK\nlocation: http://192.168.1.20:8200/rootDesc.xml\nServer: MiniDLNA/1.3\nst: urn:schemas-upnp-org:device:MediaServer:1\n\n");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->location, "http://192.168.1.20:8200/rootDesc.xml");
    EXPECT_EQ(res->server, "MiniDLNA/1.3");
    EXPECT_EQ(res->st, "urn:schemas-upnp-org:device:MediaServer:1");
    EXPECT_EQ(res->usn, "");
}

TEST(SsdpMessages, RejectsResponsesWithoutLocationOrSuccess)
{
    EXPECT_FALSE(discovery::parse_response("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"));
    EXPECT_FALSE(discovery::parse_response("HTTP/1.1 404 Not Found\r\nLOCATION: http://10.0.0.5/\r\n\r\n"));
    EXPECT_FALSE(discovery::parse_response("NOTIFY * HTTP/1.1\r\nLOCATION: http://10.0.0.5/\r\n\r\n"));
}

TEST(SsdpNaming, VendorTableWins)
{
    discovery::ssdp_res res;
    res.server = "Linux/5.10 UPnP/1.0 Platinum/1.0.5.13";
    EXPECT_EQ(discovery::friendly_name(res), "Plex Media Server");
    res.server = "Jellyfin/10.8";
    EXPECT_EQ(discovery::friendly_name(res), "Jellyfin Server");
    res.server = "Linux UPnP/1.0 HP-iLO/2.0";
    EXPECT_EQ(discovery::friendly_name(res), "HP iLO Server");
}

TEST(SsdpNaming, FallsBackToUsnThenSearchTarget)
{
    discovery::ssdp_res res;
    res.server = "Linux/4.4 UPnP/1.0 MiniUPnPd/2.0";
    res.usn = "uuid:RINCON_000E58A0B1C201400::urn:schemas-upnp-org:device:ZonePlayer:1";
    EXPECT_EQ(discovery::friendly_name(res), "Sonos Speaker");

    res.usn = "uuid:4d696e69-444c-164e-9d41-b827eb54e4b5::upnp:rootdevice";
    EXPECT_EQ(discovery::friendly_name(res), "Device 4d696e69");

    res.usn.clear();
    res.st = "urn:schemas-upnp-org:device:MediaServer:1";
    EXPECT_EQ(discovery::friendly_name(res), "Media Server");
    res.st = "urn:schemas-upnp-org:device:basic:1";
    EXPECT_EQ(discovery::friendly_name(res), "Basic Device");
    res.st = "urn:dial-multiscreen-org:service:dial:1";
    EXPECT_EQ(discovery::friendly_name(res), "urn:dial-multiscreen-org:service:dial:1");
    res.st.clear();
    EXPECT_EQ(discovery::friendly_name(res), "Unknown Device");
}

TEST(SsdpNaming, DisplayNameAddsManufacturer)
{
    EXPECT_EQ(discovery::display_name("Media Server", ""), "Media Server");
    EXPECT_EQ(discovery::display_name("Media Server", "MiniDLNA/1.3"), "Media Server (MiniDLNA/1.3)");
}

TEST(SsdpProber, SonosResponseBecomesDevice)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    discovery::ssdp_prober prober {client, log};

    discovery::location_set seen;
    auto dev = prober.handle_response(sonos_response, seen);
    ASSERT_TRUE(dev);
    EXPECT_EQ(dev->get_location(), "http://10.0.0.5:1400/desc.xml");
    EXPECT_EQ(dev->get_friendly_name(), "Sonos Speaker");
    EXPECT_EQ(dev->get_name(), "Sonos Speaker (Linux/3.14 UPnP/1.0 Sonos/1.0)");
    EXPECT_EQ(dev->get_base_url(), "http://10.0.0.5:1400");
    EXPECT_EQ(dev->get_device_type(), "upnp:rootdevice");
    EXPECT_EQ(dev->get_origin(), discovery::device_origin::ssdp);

    // Description is unreachable, browsing will use http later
    EXPECT_FALSE(dev->get_content_directory_url());
}

TEST(SsdpProber, DuplicateLocationIsIgnored)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    discovery::ssdp_prober prober {client, log};

    discovery::location_set seen;
    EXPECT_TRUE(prober.handle_response(sonos_response, seen));
    EXPECT_FALSE(prober.handle_response(sonos_response, seen));
    EXPECT_EQ(seen.size(), 1u);

    // The description is fetched once per location
    EXPECT_EQ(client.count("GET", "http://10.0.0.5:1400/desc.xml"), 1u);
}

TEST(SsdpProber, KnownLocationsAreSkipped)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    discovery::ssdp_prober prober {client, log};

    discovery::location_set seen {"http://10.0.0.5:1400/desc.xml"};
    EXPECT_FALSE(prober.handle_response(sonos_response, seen));
    EXPECT_TRUE(client.requests().empty());
}

TEST(SsdpProber, ResolvesContentDirectory)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://192.168.1.20:8200/rootDesc.xml", 200, media_server_description);
    discovery::ssdp_prober prober {client, log};

    discovery::location_set seen;
    auto dev = prober.handle_response(
        "HTTP/1.1 200 OK\r\nLOCATION: http://192.168.1.20:8200/rootDesc.xml\r\nST: urn:schemas-upnp-org:device:MediaServer:1\r\n\r\n", seen);
    ASSERT_TRUE(dev);
    EXPECT_EQ(dev->get_name(), "Media Server");
    ASSERT_TRUE(dev->get_content_directory_url());
    EXPECT_EQ(*dev->get_content_directory_url(), "http://192.168.1.20:8200/ctl/ContentDir");
}

TEST(SsdpProber, InvalidMulticastAddressIsSoftError)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    config::ssdp_settings settings;
    settings.multicast_ip = "not-an-address";
    discovery::ssdp_prober prober {client, log, settings};

    discovery::discovery_result result;
    EXPECT_NO_THROW(result = prober.probe(100ms));
    EXPECT_TRUE(result.devices.empty());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("multicast address"), std::string::npos);
}

TEST(SsdpProber, ReceiveLoopReportsEachLocationOnce)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://127.0.0.1:8200/rootDesc.xml", 200, media_server_description);
    client.on_get("http://127.0.0.1:8201/rootDesc.xml", 200, media_server_description);

    loopback_responder responder;
    discovery::ssdp_prober prober {client, log, loopback_settings(responder.port())};

    std::atomic<int> callbacks {0};
    auto answers = std::async(std::launch::async, [&responder, &callbacks]() {
        std::string search;
        auto peer = responder.receive(2s, &search);
        if(!peer || search.rfind("M-SEARCH * HTTP/1.1\r\n", 0) != 0)
            return false;

        // Same location twice in a row, and again for the second search target
        responder.reply(*peer, ssdp_answer("http://127.0.0.1:8200/rootDesc.xml"));
        responder.reply(*peer, ssdp_answer("http://127.0.0.1:8200/rootDesc.xml"));
        if(responder.receive(2s))
            responder.reply(*peer, ssdp_answer("http://127.0.0.1:8200/rootDesc.xml"));

        // The first device has to be reported before the prober reads on
        for(int i = 0; i < 200 && callbacks.load() == 0; ++i)
            std::this_thread::sleep_for(10ms);
        if(callbacks.load() != 1)
            return false;
        responder.reply(*peer, ssdp_answer("http://127.0.0.1:8201/rootDesc.xml"));
        return true;
    });

    std::vector<std::string> reported;
    const auto start = std::chrono::steady_clock::now();
    discovery::discovery_result result = prober.probe(3s, [&reported, &callbacks](const discovery::device& dev) {
        reported.push_back(dev.get_location());
        ++callbacks;
    });
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(answers.get());
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices[0].get_location(), "http://127.0.0.1:8200/rootDesc.xml");
    EXPECT_EQ(result.devices[1].get_location(), "http://127.0.0.1:8201/rootDesc.xml");
    ASSERT_TRUE(result.devices[0].get_content_directory_url());
    EXPECT_EQ(*result.devices[0].get_content_directory_url(), "http://127.0.0.1:8200/ctl/ContentDir");

    ASSERT_EQ(reported.size(), 2u);
    EXPECT_EQ(reported[0], "http://127.0.0.1:8200/rootDesc.xml");
    EXPECT_EQ(client.count("GET", "http://127.0.0.1:8200/rootDesc.xml"), 1u);

    // Stops on the first quiet read instead of waiting for the ceiling
    EXPECT_LT(elapsed, 2500ms);
}

TEST(SsdpProber, ReceiveLoopHonoursOverallCeiling)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://127.0.0.1:8200/rootDesc.xml", 200, media_server_description);

    loopback_responder responder;
    config::ssdp_settings settings = loopback_settings(responder.port());
    discovery::ssdp_prober prober {client, log, settings};

    // Keeps answering faster than the per read timeout
    std::atomic<bool> stop {false};
    auto answers = std::async(std::launch::async, [&responder, &stop]() {
        auto peer = responder.receive(2s);
        if(!peer)
            return;
        while(!stop.load())
        {
            responder.reply(*peer, ssdp_answer("http://127.0.0.1:8200/rootDesc.xml"));
            std::this_thread::sleep_for(50ms);
        }
    });

    const auto start = std::chrono::steady_clock::now();
    discovery::discovery_result result = prober.probe(700ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stop = true;
    answers.get();

    EXPECT_GE(elapsed, 700ms);
    EXPECT_LT(elapsed, 1500ms);
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(client.count("GET", "http://127.0.0.1:8200/rootDesc.xml"), 1u);
}
