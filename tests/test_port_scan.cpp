#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fake_client.hpp"
#include "logger.hpp"
#include "port_scan.hpp"

namespace
{

config::scan_settings test_network()
{
    config::scan_settings settings;
    settings.network_base = "192.0.2";
    return settings;
}

} // namespace

TEST(PortScan, ServerNamesFollowPort)
{
    EXPECT_EQ(discovery::server_name("192.168.1.10", 32400), "Plex Server (192.168.1.10:32400)");
    EXPECT_EQ(discovery::server_name("192.168.1.10", 8096), "Jellyfin Server (192.168.1.10:8096)");
    EXPECT_EQ(discovery::server_name("192.168.1.10", 8920), "Emby Server (192.168.1.10:8920)");
    EXPECT_EQ(discovery::server_name("192.168.1.10", 8080), "Media Server (192.168.1.10:8080)");
}

TEST(PortScan, UnreachableSubnetFindsNothingWithoutError)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    discovery::port_scanner scanner {client, log, test_network()};

    discovery::discovery_result result = scanner.scan();
    EXPECT_TRUE(result.devices.empty());
    EXPECT_TRUE(result.errors.empty());

    // A refused connection skips the remaining health paths
    EXPECT_EQ(client.requests().size(), 6u * 3u);
    EXPECT_EQ(client.count("GET", "http://192.0.2.1:32400/"), 1u);
    EXPECT_EQ(client.count("GET", "http://192.0.2.1:32400/status"), 0u);
}

TEST(PortScan, HealthyEndpointBecomesDevice)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://192.0.2.10:32400/", 200, "<MediaContainer/>");
    discovery::port_scanner scanner {client, log, test_network()};

    std::vector<std::string> reported;
    discovery::discovery_result result = scanner.scan([&reported](const discovery::device& dev) {
        reported.push_back(dev.get_location());
    });

    ASSERT_EQ(result.devices.size(), 1u);
    const auto& dev = result.devices[0];
    EXPECT_EQ(dev.get_name(), "Plex Server (192.0.2.10:32400)");
    EXPECT_EQ(dev.get_location(), "http://192.0.2.10:32400");
    EXPECT_EQ(dev.get_base_url(), "http://192.0.2.10:32400");
    EXPECT_EQ(dev.get_device_type(), "MediaServer");
    EXPECT_FALSE(dev.get_content_directory_url());
    EXPECT_EQ(dev.get_origin(), discovery::device_origin::port_scan);

    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], "http://192.0.2.10:32400");
}

TEST(PortScan, LaterHealthPathsAreTried)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://192.0.2.100:8096/", 404, "");
    client.time_out("GET", "http://192.0.2.100:8096/status");
    client.on_get("http://192.0.2.100:8096/identity", 200, "{}");
    discovery::port_scanner scanner {client, log, test_network()};

    auto dev = scanner.scan_endpoint("192.0.2.100", 8096);
    ASSERT_TRUE(dev);
    EXPECT_EQ(dev->get_name(), "Jellyfin Server (192.0.2.100:8096)");
}

TEST(PortScan, KnownLocationsAreSkipped)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    client.on_get("http://192.0.2.10:32400/", 200, "");
    client.on_get("http://192.0.2.254:8920/", 200, "");
    discovery::port_scanner scanner {client, log, test_network()};

    discovery::location_set known {"http://192.0.2.10:32400"};
    discovery::discovery_result result = scanner.discover(known, {});
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].get_name(), "Emby Server (192.0.2.254:8920)");
}

TEST(PortScan, ConfiguredNetworkBaseIsUsed)
{
    utils::logger log {stderr, utils::log_severity::error};
    mop_test::fake_client client;
    discovery::port_scanner scanner {client, log, test_network()};
    EXPECT_EQ(scanner.network_base(), "192.0.2");
}
