#pragma once

#include "settings/DiscoverySettings.hpp"
#include "settings/ServerSettings.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace hostlink::adapters::secondary {

/**
 * @brief Широковещательный UDP-маяк
 *
 * Раз в discovery.interval_seconds отправляет одну датаграмму:
 * {"magic": "PCLINK_DISCOVERY_BEACON_V1", "port": <HTTP-порт>,
 *  "hostname": ..., "https": true, "os": "linux", "server_id": <uuid>}
 *
 * Ошибка отправки не останавливает сервер: она логируется,
 * следующий тик пробует снова.
 *
 * Thread-safe: да
 */
class UdpDiscoveryBeacon {
public:
    static constexpr const char* MAGIC = "PCLINK_DISCOVERY_BEACON_V1";

    /**
     * @throws ValidationError если discovery.address не IP-адрес или порт вне 1..65535
     */
    UdpDiscoveryBeacon(std::shared_ptr<settings::DiscoverySettings> discovery,
                       std::shared_ptr<settings::ServerSettings> server);

    /**
     * @brief Отправить одну датаграмму
     * @return false если сокет не открылся или send_to не прошёл
     */
    bool announce();

    const std::string& payload() const { return payload_; }

    static nlohmann::json buildPayload(int apiPort,
                                       const std::string& hostname,
                                       bool https,
                                       const std::string& os,
                                       const std::string& serverId);

    /**
     * @brief UUID v5 (пространство DNS) от "<node>-<system>-<machine>"
     *
     * Одинаков между перезапусками на одной машине.
     */
    static std::string stableServerId(const std::string& node,
                                      const std::string& system,
                                      const std::string& machine);

private:
    bool ensureOpenLocked();

    boost::asio::io_context io_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint target_;
    std::string payload_;
    std::mutex mutex_;
};

} // namespace hostlink::adapters::secondary
