#pragma once

#include <IEnvironment.hpp>
#include <chrono>
#include <memory>

namespace hostlink::settings {

/**
 * @brief Настройки рукопожатия
 *
 * - pairing.timeout_seconds (default: 60)
 */
class PairingSettings {
public:
    PairingSettings() = default;

    explicit PairingSettings(std::shared_ptr<IEnvironment> env)
        : timeout_(std::chrono::seconds(env->get<int>("pairing.timeout_seconds", 60)))
    {
    }

    std::chrono::milliseconds getTimeout() const { return timeout_; }

    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
    std::chrono::milliseconds timeout_{std::chrono::seconds(60)};
};

} // namespace hostlink::settings
