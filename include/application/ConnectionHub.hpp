#pragma once

#include "domain/enums/ConnectionRole.hpp"
#include "ports/input/IConnectionRegistry.hpp"
#include "ports/output/IEventBroadcaster.hpp"

#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace hostlink::application {

/**
 * @brief Fan-out: реестр живых соединений и рассылка событий
 *
 * broadcast() обходит снимок соединений, а не живую таблицу, поэтому
 * отключение посреди рассылки не ломает обход. Соединение, на котором
 * отправка не удалась, сразу удаляется; ошибка наружу не выходит.
 */
class ConnectionHub : public ports::input::IConnectionRegistry,
                      public ports::output::IEventBroadcaster {
public:
    ConnectionHub()
    {
        std::cout << "[ConnectionHub] Created" << std::endl;
    }

    void registerConnection(std::shared_ptr<ports::output::IClientConnection> connection,
                            domain::ConnectionRole role) override
    {
        auto entry = std::make_shared<Entry>(Entry{connection, role});
        connections_.insert(connection->id(), entry);
        std::cout << "[ConnectionHub] + " << domain::toString(role) << " "
                  << connection->remoteAddress() << " (" << describeCounts() << ")" << std::endl;
    }

    void unregisterConnection(const std::string& connectionId) override
    {
        if (connections_.erase(connectionId)) {
            std::cout << "[ConnectionHub] - " << connectionId.substr(0, 8)
                      << " (" << describeCounts() << ")" << std::endl;
        }
    }

    std::size_t connectionCount() const override
    {
        return connections_.size();
    }

    std::size_t countByRole(domain::ConnectionRole role) const
    {
        std::size_t count = 0;
        for (const auto& entry : connections_.values()) {
            if (entry->role == role) {
                ++count;
            }
        }
        return count;
    }

    void broadcast(const domain::ServerEvent& event) override
    {
        const std::string frame = event.toFrame();
        for (const auto& entry : connections_.values()) {
            bool delivered = false;
            try {
                delivered = entry->connection->send(frame);
            } catch (const std::exception& e) {
                std::cerr << "[ConnectionHub] Send error: " << e.what() << std::endl;
            }
            if (!delivered) {
                std::cerr << "[ConnectionHub] Dropping connection " << entry->connection->id().substr(0, 8)
                          << " after failed '" << event.type << "'" << std::endl;
                unregisterConnection(entry->connection->id());
            }
        }
    }

private:
    /// "operator 1, mobile 2"
    std::string describeCounts() const
    {
        return domain::toString(domain::ConnectionRole::OPERATOR) + " " +
               std::to_string(countByRole(domain::ConnectionRole::OPERATOR)) + ", " +
               domain::toString(domain::ConnectionRole::MOBILE) + " " +
               std::to_string(countByRole(domain::ConnectionRole::MOBILE));
    }

    struct Entry {
        std::shared_ptr<ports::output::IClientConnection> connection;
        domain::ConnectionRole role;
    };

    ThreadSafeMap<std::string, Entry> connections_;
};

} // namespace hostlink::application
