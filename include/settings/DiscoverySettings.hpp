#pragma once

#include <IEnvironment.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace hostlink::settings {

/**
 * @brief UDP-маяк для поиска сервера в локальной сети
 *
 * - discovery.enabled          (default: 1, 0 выключает маяк)
 * - discovery.port             (default: 38099)
 * - discovery.interval_seconds (default: 5)
 * - discovery.address          (default: "255.255.255.255")
 * - discovery.server_id        (default: выводится из uname)
 */
class DiscoverySettings {
public:
    DiscoverySettings() = default;

    explicit DiscoverySettings(std::shared_ptr<IEnvironment> env)
        : enabled_(env->get<int>("discovery.enabled", 1) != 0)
        , port_(env->get<int>("discovery.port", 38099))
        , interval_(std::chrono::seconds(env->get<int>("discovery.interval_seconds", 5)))
        , address_(env->get<std::string>("discovery.address", "255.255.255.255"))
        , serverId_(env->get<std::string>("discovery.server_id", ""))
    {
    }

    bool isEnabled() const { return enabled_; }
    int getPort() const { return port_; }
    std::chrono::seconds getInterval() const { return interval_; }
    const std::string& getAddress() const { return address_; }
    const std::string& getServerId() const { return serverId_; }

    void setPort(int port) { port_ = port; }
    void setAddress(const std::string& address) { address_ = address; }
    void setServerId(const std::string& serverId) { serverId_ = serverId; }

private:
    bool enabled_ = true;
    int port_ = 38099;
    std::chrono::seconds interval_{5};
    std::string address_ = "255.255.255.255";
    std::string serverId_;
};

} // namespace hostlink::settings
