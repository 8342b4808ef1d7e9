#include "HostLinkApp.hpp"

#include <IEnvironment.hpp>

// Settings
#include "settings/DiscoverySettings.hpp"
#include "settings/PairingSettings.hpp"
#include "settings/RealtimeSettings.hpp"
#include "settings/SecuritySettings.hpp"
#include "settings/ServerSettings.hpp"
#include "settings/StorageSettings.hpp"
#include "settings/TransferSettings.hpp"

// Primary Adapters
#include "adapters/primary/ApiKeyMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/DeviceHandler.hpp"
#include "adapters/primary/DownloadHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/PairingHandler.hpp"
#include "adapters/primary/QrPayloadHandler.hpp"
#include "adapters/primary/UploadHandler.hpp"

// Application Services
#include "application/Authenticator.hpp"
#include "application/ConnectionHub.hpp"
#include "application/DeviceService.hpp"
#include "application/PairingService.hpp"
#include "application/TelemetryPublisher.hpp"
#include "application/TransferService.hpp"

// Secondary Adapters
#include "adapters/secondary/discovery/UdpDiscoveryBeacon.hpp"
#include "adapters/secondary/filesystem/FileSystemPathValidator.hpp"
#include "adapters/secondary/persistence/FileTransferStorage.hpp"
#include "adapters/secondary/persistence/JsonFileCredentialStore.hpp"
#include "adapters/secondary/realtime/WebSocketServer.hpp"
#include "adapters/secondary/scheduling/BackgroundTicker.hpp"
#include "adapters/secondary/scheduling/BlockingIoPool.hpp"
#include "adapters/secondary/security/OpenSslCertificateInfo.hpp"
#include "adapters/secondary/telemetry/ProcTelemetrySource.hpp"

#include <iostream>

namespace di = boost::di;

using namespace hostlink;

// ============================================================================
// HostLinkApp Implementation
// ============================================================================

HostLinkApp::HostLinkApp()
{
    std::cout << "[HostLinkApp] Application created" << std::endl;
}

HostLinkApp::~HostLinkApp()
{
    shutdown();
    std::cout << "[HostLinkApp] Application destroyed" << std::endl;
}

void HostLinkApp::loadEnvironment(int argc, char *argv[])
{
    std::cout << "[HostLinkApp] Loading environment..." << std::endl;

    // Вызываем базовый метод который загружает config.json в env_
    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[HostLinkApp] Environment loaded successfully" << std::endl;
}

void HostLinkApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[HostLinkApp] Configuring Boost.DI injection..." << std::endl;

    // Один экземпляр хаба и для регистрации соединений, и для рассылки
    auto hub = std::make_shared<application::ConnectionHub>();

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Settings и Secondary Adapters
        // ====================================================================

        di::bind<IEnvironment>().to(env_),

        di::bind<settings::StorageSettings>().in(di::singleton),
        di::bind<settings::SecuritySettings>().in(di::singleton),
        di::bind<settings::PairingSettings>().in(di::singleton),
        di::bind<settings::TransferSettings>().in(di::singleton),
        di::bind<settings::RealtimeSettings>().in(di::singleton),
        di::bind<settings::ServerSettings>().in(di::singleton),
        di::bind<settings::DiscoverySettings>().in(di::singleton),

        di::bind<ports::output::ICredentialStore>()
            .to<adapters::secondary::JsonFileCredentialStore>()
            .in(di::singleton),

        di::bind<ports::output::ITransferStorage>()
            .to<adapters::secondary::FileTransferStorage>()
            .in(di::singleton),

        di::bind<ports::output::IPathValidator>()
            .to<adapters::secondary::FileSystemPathValidator>()
            .in(di::singleton),

        di::bind<ports::output::ICertificateInfo>()
            .to<adapters::secondary::OpenSslCertificateInfo>()
            .in(di::singleton),

        di::bind<ports::output::ITelemetrySource>()
            .to<adapters::secondary::ProcTelemetrySource>()
            .in(di::singleton),

        di::bind<ports::output::ITaskExecutor>()
            .to<adapters::secondary::BlockingIoPool>()
            .in(di::singleton),

        di::bind<ports::input::IConnectionRegistry>().to(hub),
        di::bind<ports::output::IEventBroadcaster>().to(hub),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IAuthenticator>()
            .to<application::Authenticator>()
            .in(di::singleton),

        di::bind<ports::input::IPairingService>()
            .to<application::PairingService>()
            .in(di::singleton),

        di::bind<ports::input::IDeviceService>()
            .to<application::DeviceService>()
            .in(di::singleton),

        di::bind<ports::input::ITransferService>()
            .to<application::TransferService>()
            .in(di::singleton));

    std::cout << "[HostLinkApp] Injector configured" << std::endl;

    // ========================================================================
    // Layer 3: Primary Adapters (HTTP Handlers)
    // ========================================================================

    using namespace hostlink::adapters::primary;

    auto apiKey = injector.create<std::shared_ptr<ApiKeyMiddleware>>();
    auto masterOnly = std::make_shared<MasterKeyOnlyMiddleware>();

    auto protect = [&](std::shared_ptr<IHttpHandler> handler) {
        return std::make_shared<ChainHandler>(apiKey, handler);
    };
    auto protectMaster = [&](std::shared_ptr<IHttpHandler> handler) {
        return std::make_shared<ChainHandler>(apiKey, masterOnly, handler);
    };

    // Служебные
    {
        handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<HealthHandler>>();
        handlers_[getHandlerKey("GET", "/ping")] = protect(std::make_shared<PingHandler>());
        std::cout << "  ✓ HealthHandler: GET /health, GET /ping" << std::endl;
    }

    // Сопряжение
    {
        auto handler = injector.create<std::shared_ptr<PairingHandler>>();
        handlers_[getHandlerKey("POST", "/pairing/request")] = handler;
        handlers_[getHandlerKey("POST", "/pairing/approve")] = protectMaster(handler);
        handlers_[getHandlerKey("POST", "/pairing/deny")] = protectMaster(handler);
        handlers_[getHandlerKey("GET", "/qr-payload")] =
            protectMaster(injector.create<std::shared_ptr<QrPayloadHandler>>());
        std::cout << "  ✓ PairingHandler: POST /pairing/{request,approve,deny}, GET /qr-payload" << std::endl;
    }

    // Устройства
    {
        auto handler = injector.create<std::shared_ptr<DeviceHandler>>();
        handlers_[getHandlerKey("POST", "/pairing/reconnect")] = protect(handler);
        handlers_[getHandlerKey("POST", "/device/ip-change")] = protect(handler);
        handlers_[getHandlerKey("GET", "/devices")] = protectMaster(handler);
        handlers_[getHandlerKey("POST", "/devices/*/revoke")] = protectMaster(handler);
        handlers_[getHandlerKey("GET", "/devices/*/ip-history")] = protectMaster(handler);
        handlers_[getHandlerKey("POST", "/announce")] = protect(handler);
        std::cout << "  ✓ DeviceHandler: /devices, /pairing/reconnect, /device/ip-change, /announce" << std::endl;
    }

    // Загрузка на хост
    {
        auto handler = protect(injector.create<std::shared_ptr<UploadHandler>>());
        handlers_[getHandlerKey("GET", "/upload/config")] = handler;
        handlers_[getHandlerKey("POST", "/upload/check-conflict")] = handler;
        handlers_[getHandlerKey("POST", "/upload/initiate")] = handler;
        handlers_[getHandlerKey("POST", "/upload/chunk/*")] = handler;
        handlers_[getHandlerKey("POST", "/upload/stream/*")] = handler;
        handlers_[getHandlerKey("POST", "/upload/direct")] = handler;
        handlers_[getHandlerKey("POST", "/upload/complete/*")] = handler;
        handlers_[getHandlerKey("POST", "/upload/pause/*")] = handler;
        handlers_[getHandlerKey("POST", "/upload/resume/*")] = handler;
        handlers_[getHandlerKey("DELETE", "/upload/cancel/*")] = handler;
        handlers_[getHandlerKey("GET", "/upload/status/*")] = handler;
        handlers_[getHandlerKey("GET", "/upload/list-active")] = handler;
        std::cout << "  ✓ UploadHandler: /upload/*" << std::endl;
    }

    // Скачивание с хоста
    {
        auto handler = protect(injector.create<std::shared_ptr<DownloadHandler>>());
        handlers_[getHandlerKey("GET", "/download/config")] = handler;
        handlers_[getHandlerKey("POST", "/download/initiate")] = handler;
        handlers_[getHandlerKey("GET", "/download/chunk/*")] = handler;
        handlers_[getHandlerKey("POST", "/download/pause/*")] = handler;
        handlers_[getHandlerKey("POST", "/download/resume/*")] = handler;
        handlers_[getHandlerKey("DELETE", "/download/cancel/*")] = handler;
        handlers_[getHandlerKey("GET", "/download/status/*")] = handler;
        handlers_[getHandlerKey("GET", "/download/list-active")] = handler;
        std::cout << "  ✓ DownloadHandler: /download/*" << std::endl;
    }

    std::cout << "[HostLinkApp] " << handlers_.size() << " routes registered" << std::endl;

    // ========================================================================
    // Восстановление сессий, WebSocket-канал, фоновые задачи
    // ========================================================================

    transferService_ = injector.create<std::shared_ptr<ports::input::ITransferService>>();
    transferService_->restoreSessions();
    transferService_->sweepStale();

    broadcaster_ = hub;
    webSocketServer_ = injector.create<std::shared_ptr<adapters::secondary::WebSocketServer>>();
    webSocketServer_->start();

    telemetryPublisher_ = injector.create<std::shared_ptr<application::TelemetryPublisher>>();
    auto realtime = injector.create<std::shared_ptr<settings::RealtimeSettings>>();
    auto transfer = injector.create<std::shared_ptr<settings::TransferSettings>>();

    auto publisher = telemetryPublisher_;
    telemetryTicker_ = std::make_unique<adapters::secondary::BackgroundTicker>(
        "telemetry", [publisher]() { publisher->publish(); });
    telemetryTicker_->start(realtime->getTelemetryInterval());

    auto transferService = transferService_;
    sweepTicker_ = std::make_unique<adapters::secondary::BackgroundTicker>(
        "transfer-sweep", [transferService]() { transferService->sweepStale(); });
    sweepTicker_->start(transfer->getSweepInterval());

    auto discovery = injector.create<std::shared_ptr<settings::DiscoverySettings>>();
    if (discovery->isEnabled()) {
        auto beacon = injector.create<std::shared_ptr<adapters::secondary::UdpDiscoveryBeacon>>();
        beaconTicker_ = std::make_unique<adapters::secondary::BackgroundTicker>(
            "discovery", [beacon]() { beacon->announce(); });
        beaconTicker_->start(discovery->getInterval());
    } else {
        std::cout << "[HostLinkApp] Discovery beacon disabled" << std::endl;
    }

    broadcaster_->broadcast(domain::ServerEvent::serverStatus("running", HOSTLINK_VERSION));

    std::cout << "[HostLinkApp] Ready, WebSocket on port " << webSocketServer_->port() << std::endl;
}

void HostLinkApp::shutdown()
{
    std::call_once(shutdownOnce_, [this]() {
        if (broadcaster_) {
            broadcaster_->broadcast(domain::ServerEvent::serverStatus("stopping", HOSTLINK_VERSION));
        }
        if (telemetryTicker_) {
            telemetryTicker_->stop();
        }
        if (sweepTicker_) {
            sweepTicker_->stop();
        }
        if (beaconTicker_) {
            beaconTicker_->stop();
        }
        if (webSocketServer_) {
            webSocketServer_->stop();
        }
        std::cout << "[HostLinkApp] Background services stopped" << std::endl;
    });
}

void HostLinkApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     HostLink: remote control server                  ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "║  Realtime:     Boost.Beast WebSocket                 ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
