#pragma once

#include "domain/enums/ConnectionRole.hpp"
#include "ports/input/IAuthenticator.hpp"
#include "ports/input/IConnectionRegistry.hpp"
#include "ports/input/IPairingService.hpp"
#include "ports/output/IClientConnection.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace hostlink::adapters::secondary {

/**
 * @brief Одно WebSocket-соединение (ws://host:port/ws?token=<key>)
 *
 * Жизненный цикл: HTTP upgrade -> проверка ключа -> accept.
 * Неверный ключ: соединение принимается и сразу закрывается кодом 1008.
 * Верный ключ: регистрируется в IConnectionRegistry с ролью operator
 * (мастер-ключ) или mobile (ключ устройства).
 *
 * Оператор может ответить на pairing_request прямо по каналу:
 * {"type":"pairing_decision","data":{"pairing_id":"...","approved":true}}.
 * Ответ приходит кадром pairing_decision со status approved, denied,
 * already_decided, not_found или forbidden (не мастер-ключ).
 *
 * Все операции над сокетом выполняются на strand соединения, send()
 * можно вызывать из любого потока.
 */
class WebSocketConnection : public ports::output::IClientConnection,
                            public std::enable_shared_from_this<WebSocketConnection> {
public:
    /// Кадры сверх этого числа в очереди отправки означают "клиент не успевает"
    static constexpr std::size_t MAX_OUTBOX = 64;

    WebSocketConnection(boost::asio::ip::tcp::socket socket,
                        std::shared_ptr<ports::input::IAuthenticator> authenticator,
                        std::shared_ptr<ports::input::IConnectionRegistry> registry,
                        std::shared_ptr<ports::input::IPairingService> pairing);

    void run();

    const std::string& id() const override { return id_; }
    const std::string& remoteAddress() const override { return remoteAddress_; }

    bool send(const std::string& frame) override;

    /**
     * @brief Закрыть соединение (остановка сервера)
     */
    void close();

    /**
     * @brief Достать token из query-строки "/ws?token=..."
     */
    static std::optional<std::string> extractToken(const std::string& target);

private:
    void onHandshakeRead(boost::beast::error_code ec);
    void onAccept(boost::beast::error_code ec, std::optional<domain::ClientIdentity> identity);
    void doRead();
    void onRead(boost::beast::error_code ec);
    void doWrite();
    void onWrite(boost::beast::error_code ec);
    void handleClientFrame(const std::string& text);
    void handlePairingDecision(const nlohmann::json& data);
    void markClosed(const std::string& reason);

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> request_;
    std::deque<std::string> outbox_;

    std::shared_ptr<ports::input::IAuthenticator> authenticator_;
    std::shared_ptr<ports::input::IConnectionRegistry> registry_;
    std::shared_ptr<ports::input::IPairingService> pairing_;

    std::string id_;
    std::string remoteAddress_;
    bool isOperator_ = false;
    std::atomic<bool> closed_{false};
    std::atomic<std::size_t> queued_{0};
};

} // namespace hostlink::adapters::secondary
