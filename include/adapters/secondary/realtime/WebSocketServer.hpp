#pragma once

#include "ports/input/IAuthenticator.hpp"
#include "ports/input/IConnectionRegistry.hpp"
#include "ports/input/IPairingService.hpp"
#include "settings/RealtimeSettings.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace hostlink::adapters::secondary {

class WebSocketConnection;

/**
 * @brief Слушатель WebSocket-канала на Boost.Beast
 *
 * Свой io_context и рабочий поток, start()/stop() как у других
 * фоновых адаптеров. Решения по сопряжению, пришедшие по каналу,
 * обрабатываются здесь и не ждут свободного HTTP-потока.
 */
class WebSocketServer {
public:
    WebSocketServer(std::shared_ptr<settings::RealtimeSettings> settings,
                    std::shared_ptr<ports::input::IAuthenticator> authenticator,
                    std::shared_ptr<ports::input::IConnectionRegistry> registry,
                    std::shared_ptr<ports::input::IPairingService> pairing);

    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /**
     * @brief Открыть порт и запустить рабочий поток
     * @throws boost::system::system_error если порт занят
     */
    void start();

    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Фактический порт (полезно при realtime.port = 0)
     */
    unsigned short port() const;

    /**
     * @brief Пауза перед повторным accept после ошибки
     *
     * 50 мс, удваивается с каждой ошибкой подряд, не больше секунды.
     * Нужна, чтобы EMFILE/ENFILE не крутил цикл accept вхолостую.
     */
    static std::chrono::milliseconds acceptRetryDelay(unsigned consecutiveFailures);

private:
    void doAccept();
    void scheduleAcceptRetry();

    std::shared_ptr<settings::RealtimeSettings> settings_;
    std::shared_ptr<ports::input::IAuthenticator> authenticator_;
    std::shared_ptr<ports::input::IConnectionRegistry> registry_;
    std::shared_ptr<ports::input::IPairingService> pairing_;

    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer acceptRetryTimer_;
    unsigned acceptFailures_ = 0;
    std::thread workerThread_;
    std::atomic<bool> running_{false};

    std::mutex connectionsMutex_;
    std::vector<std::weak_ptr<WebSocketConnection>> connections_;
};

} // namespace hostlink::adapters::secondary
