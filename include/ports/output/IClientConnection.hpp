#pragma once

#include <string>

namespace hostlink::ports::output {

/**
 * @brief Живое двунаправленное соединение с клиентом
 */
class IClientConnection {
public:
    virtual ~IClientConnection() = default;

    virtual const std::string& id() const = 0;

    virtual const std::string& remoteAddress() const = 0;

    /**
     * @brief Поставить кадр в очередь отправки
     * @return false если соединение уже закрыто или отправка не удалась
     */
    virtual bool send(const std::string& frame) = 0;
};

} // namespace hostlink::ports::output
