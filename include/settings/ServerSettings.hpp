#pragma once

#include "utils/Network.hpp"
#include <IEnvironment.hpp>
#include <memory>
#include <string>

namespace hostlink::settings {

/**
 * @brief Как HTTP API виден клиентам (для QR-кода сопряжения)
 *
 * Ключи в config.json:
 * - server.port           (default: 38080)
 * - server.advertised_ip  (default: первый не-loopback IPv4)
 * - server.protocol       (default: "https")
 */
class ServerSettings {
public:
    ServerSettings() : advertisedIp_(utils::primaryIpv4Address()) {}

    explicit ServerSettings(std::shared_ptr<IEnvironment> env)
        : port_(env->get<int>("server.port", 38080))
        , advertisedIp_(env->get<std::string>("server.advertised_ip", ""))
        , protocol_(env->get<std::string>("server.protocol", "https"))
    {
        if (advertisedIp_.empty()) {
            advertisedIp_ = utils::primaryIpv4Address();
        }
    }

    int getPort() const { return port_; }
    const std::string& getAdvertisedIp() const { return advertisedIp_; }
    const std::string& getProtocol() const { return protocol_; }

private:
    int port_ = 38080;
    std::string advertisedIp_;
    std::string protocol_ = "https";
};

} // namespace hostlink::settings
