#pragma once

#include "ports/input/IAuthenticator.hpp"
#include "ports/output/ICredentialStore.hpp"
#include "ports/output/ITaskExecutor.hpp"
#include "utils/LogSanitizer.hpp"

#include <iostream>
#include <memory>

namespace hostlink::application {

/**
 * @brief Проверка x-api-key: мастер-ключ или ключ одобренного устройства
 *
 * После успешной проверки ключа устройства обновление current_ip/last_seen
 * уходит в пул ввода-вывода и ответ не ждёт записи на диск.
 */
class Authenticator : public ports::input::IAuthenticator {
public:
    Authenticator(std::shared_ptr<ports::output::ICredentialStore> store,
                  std::shared_ptr<ports::output::ITaskExecutor> executor)
        : store_(std::move(store))
        , executor_(std::move(executor))
    {
        std::cout << "[Authenticator] Created" << std::endl;
    }

    std::optional<domain::ClientIdentity> authenticate(const std::string& apiKey,
                                                       const std::string& ip) override
    {
        if (apiKey.empty()) {
            return std::nullopt;
        }

        if (apiKey == store_->masterKey()) {
            domain::ClientIdentity identity;
            identity.clientId = apiKey;
            identity.isMaster = true;
            return identity;
        }

        auto device = store_->lookupByKey(apiKey);
        if (!device || !device->isApproved) {
            std::cerr << "[Authenticator] Rejected key " << utils::maskKey(utils::sanitizeForLog(apiKey, 64))
                      << " from " << utils::sanitizeForLog(ip, 64) << std::endl;
            return std::nullopt;
        }

        auto store = store_;
        std::string deviceId = device->deviceId;
        executor_->post([store, deviceId, ip]() {
            store->touch(deviceId, ip);
        });

        domain::ClientIdentity identity;
        identity.clientId = device->deviceId;
        identity.deviceId = device->deviceId;
        identity.isMaster = false;
        return identity;
    }

private:
    std::shared_ptr<ports::output::ICredentialStore> store_;
    std::shared_ptr<ports::output::ITaskExecutor> executor_;
};

} // namespace hostlink::application
