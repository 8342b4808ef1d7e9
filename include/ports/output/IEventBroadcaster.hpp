#pragma once

#include "domain/ServerEvent.hpp"

namespace hostlink::ports::output {

/**
 * @brief Рассылка серверных событий всем живым соединениям
 *
 * Best-effort: ошибки доставки не возвращаются вызывающему.
 */
class IEventBroadcaster {
public:
    virtual ~IEventBroadcaster() = default;

    virtual void broadcast(const domain::ServerEvent& event) = 0;
};

} // namespace hostlink::ports::output
