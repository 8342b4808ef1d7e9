#pragma once

#include "ports/output/IEventBroadcaster.hpp"
#include "ports/output/ITelemetrySource.hpp"

#include <iostream>
#include <memory>

namespace hostlink::application {

/**
 * @brief Периодический производитель события "update"
 *
 * Снимок отправляется целиком, получатели не зависят от предыдущих кадров.
 */
class TelemetryPublisher {
public:
    TelemetryPublisher(std::shared_ptr<ports::output::ITelemetrySource> source,
                       std::shared_ptr<ports::output::IEventBroadcaster> broadcaster)
        : source_(std::move(source))
        , broadcaster_(std::move(broadcaster))
    {
        std::cout << "[TelemetryPublisher] Created" << std::endl;
    }

    void publish()
    {
        auto snapshot = source_->snapshot();
        broadcaster_->broadcast(domain::ServerEvent::update(snapshot.toJson()));
    }

private:
    std::shared_ptr<ports::output::ITelemetrySource> source_;
    std::shared_ptr<ports::output::IEventBroadcaster> broadcaster_;
};

} // namespace hostlink::application
