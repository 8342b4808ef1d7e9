#include "adapters/secondary/discovery/UdpDiscoveryBeacon.hpp"

#include "domain/Errors.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <iostream>

namespace hostlink::adapters::secondary {

UdpDiscoveryBeacon::UdpDiscoveryBeacon(std::shared_ptr<settings::DiscoverySettings> discovery,
                                       std::shared_ptr<settings::ServerSettings> server)
    : socket_(io_)
{
    const int port = discovery->getPort();
    if (port < 1 || port > 65535) {
        throw domain::ValidationError("discovery.port must be between 1 and 65535");
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(discovery->getAddress(), ec);
    if (ec) {
        throw domain::ValidationError("discovery.address is not an IP address: " + discovery->getAddress());
    }
    target_ = boost::asio::ip::udp::endpoint(address, static_cast<unsigned short>(port));

    std::string system = "unknown";
    std::string node;
    std::string machine;
    utsname uts{};
    if (uname(&uts) == 0) {
        system = uts.sysname;
        node = uts.nodename;
        machine = uts.machine;
    }
    std::transform(system.begin(), system.end(), system.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string serverId = discovery->getServerId();
    if (serverId.empty()) {
        serverId = stableServerId(node, system, machine);
    }

    std::string hostname = boost::asio::ip::host_name(ec);
    if (ec) {
        hostname = node;
    }

    payload_ = buildPayload(server->getPort(), hostname, server->getProtocol() == "https",
                            system, serverId).dump();

    std::cout << "[UdpDiscoveryBeacon] Created: " << target_ << ", server_id " << serverId << std::endl;
}

bool UdpDiscoveryBeacon::announce()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureOpenLocked()) {
        return false;
    }

    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(payload_), target_, 0, ec);
    if (ec) {
        std::cerr << "[UdpDiscoveryBeacon] send_to " << target_ << " failed: " << ec.message() << std::endl;
        // сокет мог стать негодным (сменился интерфейс), следующий тик откроет заново
        socket_.close(ec);
        return false;
    }
    return true;
}

bool UdpDiscoveryBeacon::ensureOpenLocked()
{
    if (socket_.is_open()) {
        return true;
    }

    boost::system::error_code ec;
    socket_.open(target_.protocol(), ec);
    if (!ec) {
        socket_.set_option(boost::asio::socket_base::broadcast(true), ec);
    }
    if (ec) {
        std::cerr << "[UdpDiscoveryBeacon] Cannot open socket: " << ec.message() << std::endl;
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }
    return true;
}

nlohmann::json UdpDiscoveryBeacon::buildPayload(int apiPort,
                                                const std::string& hostname,
                                                bool https,
                                                const std::string& os,
                                                const std::string& serverId)
{
    nlohmann::json payload;
    payload["magic"] = MAGIC;
    payload["port"] = apiPort;
    payload["hostname"] = hostname;
    payload["https"] = https;
    payload["os"] = os;
    payload["server_id"] = serverId;
    return payload;
}

std::string UdpDiscoveryBeacon::stableServerId(const std::string& node,
                                               const std::string& system,
                                               const std::string& machine)
{
    boost::uuids::name_generator_sha1 generator(boost::uuids::ns::dns());
    return boost::uuids::to_string(generator(node + "-" + system + "-" + machine));
}

} // namespace hostlink::adapters::secondary
