#include "adapters/secondary/realtime/WebSocketServer.hpp"

#include "adapters/secondary/realtime/WebSocketConnection.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <iostream>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace hostlink::adapters::secondary {

WebSocketServer::WebSocketServer(std::shared_ptr<settings::RealtimeSettings> settings,
                                 std::shared_ptr<ports::input::IAuthenticator> authenticator,
                                 std::shared_ptr<ports::input::IConnectionRegistry> registry,
                                 std::shared_ptr<ports::input::IPairingService> pairing)
    : settings_(std::move(settings))
    , authenticator_(std::move(authenticator))
    , registry_(std::move(registry))
    , pairing_(std::move(pairing))
    , acceptor_(ioContext_)
    , acceptRetryTimer_(ioContext_)
{
    std::cout << "[WebSocketServer] Created for " << settings_->getHost()
              << ":" << settings_->getPort() << std::endl;
}

WebSocketServer::~WebSocketServer()
{
    stop();
}

void WebSocketServer::start()
{
    if (running_.exchange(true)) {
        return;
    }

    try {
        tcp::endpoint endpoint(net::ip::make_address(settings_->getHost()),
                               static_cast<unsigned short>(settings_->getPort()));
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
    } catch (const boost::system::system_error& e) {
        running_ = false;
        std::cerr << "[WebSocketServer] Cannot listen: " << e.what() << std::endl;
        throw;
    }

    doAccept();

    workerThread_ = std::thread([this]() {
        try {
            ioContext_.run();
        } catch (const std::exception& e) {
            std::cerr << "[WebSocketServer] Worker error: " << e.what() << std::endl;
        }
    });

    std::cout << "[WebSocketServer] Listening on ws://" << settings_->getHost()
              << ":" << port() << "/ws" << std::endl;
}

void WebSocketServer::stop()
{
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        for (auto& weak : connections_) {
            if (auto connection = weak.lock()) {
                connection->close();
            }
        }
        connections_.clear();
    }

    net::post(ioContext_, [this]() {
        boost::system::error_code ec;
        acceptRetryTimer_.cancel();
        acceptor_.close(ec);
    });

    // даём close-кадрам уйти, затем останавливаем цикл
    auto guard = std::make_shared<net::steady_timer>(ioContext_, std::chrono::milliseconds(200));
    guard->async_wait([this, guard](const boost::system::error_code&) {
        ioContext_.stop();
    });

    if (workerThread_.joinable()) {
        workerThread_.join();
    }
    std::cout << "[WebSocketServer] Stopped" << std::endl;
}

unsigned short WebSocketServer::port() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? static_cast<unsigned short>(settings_->getPort()) : endpoint.port();
}

std::chrono::milliseconds WebSocketServer::acceptRetryDelay(unsigned consecutiveFailures)
{
    const std::chrono::milliseconds base(50);
    const std::chrono::milliseconds limit(1000);
    if (consecutiveFailures == 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = base;
    for (unsigned i = 1; i < consecutiveFailures && delay < limit; ++i) {
        delay *= 2;
    }
    return std::min(delay, limit);
}

void WebSocketServer::doAccept()
{
    acceptor_.async_accept(net::make_strand(ioContext_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
                    return;
                }
                ++acceptFailures_;
                std::cerr << "[WebSocketServer] Accept error: " << ec.message()
                          << ", retry in " << acceptRetryDelay(acceptFailures_).count() << " ms" << std::endl;
                scheduleAcceptRetry();
                return;
            }

            acceptFailures_ = 0;
            auto connection = std::make_shared<WebSocketConnection>(
                std::move(socket), authenticator_, registry_, pairing_);
            {
                std::lock_guard<std::mutex> lock(connectionsMutex_);
                connections_.erase(
                    std::remove_if(connections_.begin(), connections_.end(),
                                   [](const auto& weak) { return weak.expired(); }),
                    connections_.end());
                connections_.push_back(connection);
            }
            connection->run();
            doAccept();
        });
}

void WebSocketServer::scheduleAcceptRetry()
{
    acceptRetryTimer_.expires_after(acceptRetryDelay(acceptFailures_));
    acceptRetryTimer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !acceptor_.is_open()) {
            return;
        }
        doAccept();
    });
}

} // namespace hostlink::adapters::secondary
