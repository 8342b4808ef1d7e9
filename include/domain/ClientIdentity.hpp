#pragma once

#include <string>

namespace hostlink::domain {

/**
 * @brief Кто сделал запрос после успешной аутентификации
 *
 * clientId владеет сессиями передачи: это device_id для ключа устройства
 * и сам мастер-ключ для оператора.
 */
struct ClientIdentity {
    std::string clientId;
    std::string deviceId;   ///< пусто для мастер-ключа
    bool isMaster = false;
};

} // namespace hostlink::domain
