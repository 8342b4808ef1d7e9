#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>
#include <mutex>

namespace hostlink::ports::input {
    class ITransferService;
}

namespace hostlink::ports::output {
    class IEventBroadcaster;
}

namespace hostlink::application {
    class TelemetryPublisher;
}

namespace hostlink::adapters::secondary {
    class BackgroundTicker;
    class WebSocketServer;
}

/**
 * @class HostLinkApp
 * @brief Сервер удалённого управления хостом
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - Boost.DI, регистрация handlers, запуск
 *    WebSocket-канала и фоновых тикеров
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: HTTP Handlers, WebSocket-соединения
 * - Secondary Adapters: JSON-хранилище устройств, файловое хранилище
 *   передач, OpenSSL, /proc, пул ввода-вывода, UDP-маяк
 */
class HostLinkApp : public BoostBeastApplication
{
public:
    HostLinkApp();
    ~HostLinkApp() override;

    /**
     * @brief Остановить WebSocket-канал и тикеры, разослать "stopping"
     *
     * Идемпотентно, вызывается из main после run() и из деструктора.
     */
    void shutdown();

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    void configureInjection() override;

private:
    void printStartupBanner();

    std::shared_ptr<hostlink::ports::input::ITransferService> transferService_;
    std::shared_ptr<hostlink::ports::output::IEventBroadcaster> broadcaster_;
    std::shared_ptr<hostlink::application::TelemetryPublisher> telemetryPublisher_;
    std::shared_ptr<hostlink::adapters::secondary::WebSocketServer> webSocketServer_;
    std::unique_ptr<hostlink::adapters::secondary::BackgroundTicker> telemetryTicker_;
    std::unique_ptr<hostlink::adapters::secondary::BackgroundTicker> sweepTicker_;
    std::unique_ptr<hostlink::adapters::secondary::BackgroundTicker> beaconTicker_;

    std::once_flag shutdownOnce_;
};
