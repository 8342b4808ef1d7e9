/**
 * @file UdpDiscoveryBeaconTest.cpp
 * @brief Тесты UDP-маяка обнаружения
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "adapters/secondary/discovery/UdpDiscoveryBeacon.hpp"
#include "domain/Errors.hpp"
#include "utils/UuidGenerator.hpp"

#include <boost/asio/ip/udp.hpp>

#include <array>
#include <chrono>
#include <thread>

using namespace hostlink;
using namespace hostlink::adapters::secondary;
using json = nlohmann::json;
using boost::asio::ip::udp;

TEST(UdpDiscoveryBeaconTest, BuildPayload_AllFields) {
    auto payload = UdpDiscoveryBeacon::buildPayload(38080, "workstation", true, "linux", "id-1");

    EXPECT_EQ(payload["magic"], "PCLINK_DISCOVERY_BEACON_V1");
    EXPECT_EQ(payload["port"], 38080);
    EXPECT_EQ(payload["hostname"], "workstation");
    EXPECT_EQ(payload["https"], true);
    EXPECT_EQ(payload["os"], "linux");
    EXPECT_EQ(payload["server_id"], "id-1");
}

TEST(UdpDiscoveryBeaconTest, StableServerId_DeterministicUuid) {
    auto first = UdpDiscoveryBeacon::stableServerId("box", "linux", "x86_64");
    auto second = UdpDiscoveryBeacon::stableServerId("box", "linux", "x86_64");
    auto other = UdpDiscoveryBeacon::stableServerId("box2", "linux", "x86_64");

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_TRUE(utils::UuidGenerator::isValid(first));
    EXPECT_EQ(first[14], '5');  // name-based SHA-1
}

TEST(UdpDiscoveryBeaconTest, InvalidAddressOrPort_Rejected) {
    auto server = std::make_shared<settings::ServerSettings>();

    auto badAddress = std::make_shared<settings::DiscoverySettings>();
    badAddress->setAddress("not-an-address");
    EXPECT_THROW({ UdpDiscoveryBeacon beacon(badAddress, server); }, domain::ValidationError);

    auto badPort = std::make_shared<settings::DiscoverySettings>();
    badPort->setPort(70000);
    EXPECT_THROW({ UdpDiscoveryBeacon beacon(badPort, server); }, domain::ValidationError);
}

TEST(UdpDiscoveryBeaconTest, Announce_DatagramReachesListener) {
    boost::asio::io_context io;
    udp::socket listener(io, udp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    listener.non_blocking(true);

    auto discovery = std::make_shared<settings::DiscoverySettings>();
    discovery->setAddress("127.0.0.1");
    discovery->setPort(listener.local_endpoint().port());
    discovery->setServerId("fixed-server-id");
    auto server = std::make_shared<settings::ServerSettings>();

    UdpDiscoveryBeacon beacon(discovery, server);
    ASSERT_TRUE(beacon.announce());

    std::array<char, 2048> buffer{};
    std::size_t received = 0;
    boost::system::error_code ec;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    do {
        udp::endpoint sender;
        received = listener.receive_from(boost::asio::buffer(buffer), sender, 0, ec);
        if (ec == boost::asio::error::would_block) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    } while (ec == boost::asio::error::would_block && std::chrono::steady_clock::now() < deadline);

    ASSERT_FALSE(ec) << ec.message();
    auto payload = json::parse(std::string(buffer.data(), received));
    EXPECT_EQ(payload["magic"], "PCLINK_DISCOVERY_BEACON_V1");
    EXPECT_EQ(payload["port"], server->getPort());
    EXPECT_EQ(payload["https"], true);
    EXPECT_EQ(payload["server_id"], "fixed-server-id");
    EXPECT_FALSE(payload["hostname"].get<std::string>().empty());
    EXPECT_EQ(std::string(buffer.data(), received), beacon.payload());
}
