#pragma once

#include "domain/enums/ConnectionRole.hpp"
#include "ports/output/IClientConnection.hpp"
#include <memory>
#include <string>

namespace hostlink::ports::input {

/**
 * @brief Реестр живых соединений (сторона, которую вызывает транспорт)
 */
class IConnectionRegistry {
public:
    virtual ~IConnectionRegistry() = default;

    virtual void registerConnection(std::shared_ptr<output::IClientConnection> connection,
                                    domain::ConnectionRole role) = 0;

    virtual void unregisterConnection(const std::string& connectionId) = 0;

    virtual std::size_t connectionCount() const = 0;
};

} // namespace hostlink::ports::input
