#pragma once

#include <IEnvironment.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace hostlink::settings {

/**
 * @brief WebSocket-канал и телеметрия
 *
 * - realtime.host                       (default: "0.0.0.0")
 * - realtime.port                       (default: 8766)
 * - realtime.telemetry_interval_seconds (default: 2)
 */
class RealtimeSettings {
public:
    RealtimeSettings() = default;

    explicit RealtimeSettings(std::shared_ptr<IEnvironment> env)
        : host_(env->get<std::string>("realtime.host", "0.0.0.0"))
        , port_(env->get<int>("realtime.port", 8766))
        , telemetryInterval_(std::chrono::seconds(env->get<int>("realtime.telemetry_interval_seconds", 2)))
    {
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    std::chrono::seconds getTelemetryInterval() const { return telemetryInterval_; }

    void setPort(int port) { port_ = port; }

private:
    std::string host_ = "0.0.0.0";
    int port_ = 8766;
    std::chrono::seconds telemetryInterval_{2};
};

} // namespace hostlink::settings
