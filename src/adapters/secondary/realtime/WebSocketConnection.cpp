#include "adapters/secondary/realtime/WebSocketConnection.hpp"

#include "domain/Errors.hpp"
#include "domain/ServerEvent.hpp"
#include "utils/LogSanitizer.hpp"
#include "utils/UuidGenerator.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;

namespace hostlink::adapters::secondary {

WebSocketConnection::WebSocketConnection(net::ip::tcp::socket socket,
                                         std::shared_ptr<ports::input::IAuthenticator> authenticator,
                                         std::shared_ptr<ports::input::IConnectionRegistry> registry,
                                         std::shared_ptr<ports::input::IPairingService> pairing)
    : ws_(std::move(socket))
    , authenticator_(std::move(authenticator))
    , registry_(std::move(registry))
    , pairing_(std::move(pairing))
    , id_(utils::UuidGenerator::generate())
{
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    remoteAddress_ = ec ? "unknown" : endpoint.address().to_string();
}

void WebSocketConnection::run()
{
    auto self = shared_from_this();
    net::dispatch(ws_.get_executor(), [self]() {
        beast::get_lowest_layer(self->ws_).expires_after(std::chrono::seconds(30));
        http::async_read(self->ws_.next_layer(), self->buffer_, self->request_,
            [self](beast::error_code ec, std::size_t) {
                self->onHandshakeRead(ec);
            });
    });
}

std::optional<std::string> WebSocketConnection::extractToken(const std::string& target)
{
    auto query = target.find('?');
    if (query == std::string::npos) {
        return std::nullopt;
    }
    std::string params = target.substr(query + 1);
    std::size_t pos = 0;
    while (pos <= params.size()) {
        auto amp = params.find('&', pos);
        std::string pair = params.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (pair.rfind("token=", 0) == 0) {
            return pair.substr(6);
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

void WebSocketConnection::onHandshakeRead(beast::error_code ec)
{
    if (ec) {
        markClosed("handshake read: " + ec.message());
        return;
    }
    if (!websocket::is_upgrade(request_)) {
        std::cerr << "[WebSocketConnection] Non-upgrade request from " << remoteAddress_ << std::endl;
        beast::get_lowest_layer(ws_).socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
        markClosed("not a websocket upgrade");
        return;
    }

    std::string target(request_.target());
    std::string token = extractToken(target).value_or("");
    if (token.empty()) {
        auto header = request_.find("x-api-key");
        if (header != request_.end()) {
            token = std::string(header->value());
        }
    }

    auto identity = authenticator_->authenticate(token, remoteAddress_);

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

    auto self = shared_from_this();
    ws_.async_accept(request_, [self, identity](beast::error_code acceptEc) {
        self->onAccept(acceptEc, identity);
    });
}

void WebSocketConnection::onAccept(beast::error_code ec, std::optional<domain::ClientIdentity> identity)
{
    if (ec) {
        markClosed("accept: " + ec.message());
        return;
    }

    if (!identity) {
        std::cerr << "[WebSocketConnection] Rejected " << remoteAddress_ << ": invalid API key" << std::endl;
        closed_ = true;
        auto self = shared_from_this();
        ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, "Invalid API Key"),
            [self](beast::error_code) {});
        return;
    }

    isOperator_ = identity->isMaster;
    auto role = isOperator_ ? domain::ConnectionRole::OPERATOR : domain::ConnectionRole::MOBILE;
    registry_->registerConnection(shared_from_this(), role);
    doRead();
}

void WebSocketConnection::doRead()
{
    auto self = shared_from_this();
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t) {
        self->onRead(ec);
    });
}

void WebSocketConnection::onRead(beast::error_code ec)
{
    if (ec) {
        markClosed(ec == websocket::error::closed ? "closed by client" : ec.message());
        return;
    }
    handleClientFrame(beast::buffers_to_string(buffer_.data()));
    buffer_.consume(buffer_.size());
    doRead();
}

void WebSocketConnection::handleClientFrame(const std::string& text)
{
    try {
        auto frame = nlohmann::json::parse(text);
        std::string type = frame.value("type", "");
        if (type == "pairing_decision") {
            handlePairingDecision(frame.value("data", nlohmann::json::object()));
            return;
        }
        // управление мышью/клавиатурой/медиа выполняют внешние бэкенды
        std::cout << "[WebSocketConnection] " << id_.substr(0, 8) << " frame '"
                  << utils::sanitizeForLog(type, 64) << "' ignored" << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[WebSocketConnection] Malformed frame from " << remoteAddress_
                  << ": " << e.what() << std::endl;
    }
}

void WebSocketConnection::handlePairingDecision(const nlohmann::json& data)
{
    std::string pairingId = data.is_object() ? data.value("pairing_id", "") : "";
    bool approve = data.is_object() && data.value("approved", false);

    if (!isOperator_) {
        std::cerr << "[WebSocketConnection] pairing_decision from non-operator " << remoteAddress_ << std::endl;
        send(domain::ServerEvent::pairingDecision(pairingId, "forbidden", false).toFrame());
        return;
    }

    try {
        auto result = pairing_->decide(pairingId, approve);
        std::string status = result.recorded ? (result.approved ? "approved" : "denied") : "already_decided";
        send(domain::ServerEvent::pairingDecision(pairingId, status, result.approved).toFrame());
    } catch (const domain::NotFoundError&) {
        send(domain::ServerEvent::pairingDecision(pairingId, "not_found", false).toFrame());
    }
}

bool WebSocketConnection::send(const std::string& frame)
{
    if (closed_.load()) {
        return false;
    }
    if (queued_.load() >= MAX_OUTBOX) {
        std::cerr << "[WebSocketConnection] " << id_.substr(0, 8) << " outbox full, closing" << std::endl;
        close();
        return false;
    }

    ++queued_;
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, frame]() {
        if (self->closed_.load()) {
            --self->queued_;
            return;
        }
        self->outbox_.push_back(frame);
        if (self->outbox_.size() == 1) {
            self->doWrite();
        }
    });
    return true;
}

void WebSocketConnection::doWrite()
{
    auto self = shared_from_this();
    ws_.text(true);
    ws_.async_write(net::buffer(outbox_.front()), [self](beast::error_code ec, std::size_t) {
        self->onWrite(ec);
    });
}

void WebSocketConnection::onWrite(beast::error_code ec)
{
    outbox_.pop_front();
    --queued_;
    if (ec) {
        markClosed("write: " + ec.message());
        return;
    }
    if (!outbox_.empty()) {
        doWrite();
    }
}

void WebSocketConnection::close()
{
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self]() {
        if (self->closed_.exchange(true)) {
            return;
        }
        self->registry_->unregisterConnection(self->id_);
        self->ws_.async_close(websocket::close_code::going_away, [self](beast::error_code) {});
    });
}

void WebSocketConnection::markClosed(const std::string& reason)
{
    bool wasClosed = closed_.exchange(true);
    registry_->unregisterConnection(id_);
    if (!wasClosed) {
        std::cout << "[WebSocketConnection] " << id_.substr(0, 8) << " (" << remoteAddress_
                  << ") closed: " << reason << std::endl;
    }
}

} // namespace hostlink::adapters::secondary
