#pragma once

#include "domain/ClientIdentity.hpp"
#include <optional>
#include <string>

namespace hostlink::ports::input {

/**
 * @brief Аутентификация по x-api-key (HTTP) или token (WebSocket)
 */
class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    /**
     * @brief Проверить ключ
     *
     * Принимается мастер-ключ или ключ одобренного устройства.
     * Любой другой случай (нет ключа, неизвестный, неодобренный)
     * неразличим для вызывающего: nullopt.
     *
     * @param apiKey значение заголовка
     * @param ip адрес клиента, для обновления current_ip устройства
     */
    virtual std::optional<domain::ClientIdentity> authenticate(const std::string& apiKey,
                                                               const std::string& ip) = 0;
};

} // namespace hostlink::ports::input
