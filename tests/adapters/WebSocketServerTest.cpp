/**
 * @file WebSocketServerTest.cpp
 * @brief Тесты WebSocket-канала: настоящий клиент Boost.Beast против сервера на эфемерном порту
 */

#include <gtest/gtest.h>

#include "adapters/secondary/realtime/WebSocketServer.hpp"
#include "application/Authenticator.hpp"
#include "application/ConnectionHub.hpp"
#include "application/PairingService.hpp"
#include "mocks/FakeCertificateInfo.hpp"
#include "mocks/InMemoryCredentialStore.hpp"
#include "mocks/InlineExecutor.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <thread>

using namespace hostlink;
using namespace hostlink::adapters::secondary;
using namespace hostlink::tests;
using namespace std::chrono_literals;

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class WebSocketServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryCredentialStore>();
        hub_ = std::make_shared<application::ConnectionHub>();
        auto authenticator = std::make_shared<application::Authenticator>(store_, std::make_shared<InlineExecutor>());
        auto realtime = std::make_shared<settings::RealtimeSettings>();
        realtime->setPort(0);
        auto pairingSettings = std::make_shared<settings::PairingSettings>();
        pairingSettings->setTimeout(5s);
        pairing_ = std::make_shared<application::PairingService>(
            store_, hub_, std::make_shared<FakeCertificateInfo>(std::string(64, 'a')), pairingSettings);
        server_ = std::make_shared<WebSocketServer>(realtime, authenticator, hub_, pairing_);
    }

    void TearDown() override {
        server_->stop();
    }

    /// Открыть клиентское соединение с ?token=
    std::unique_ptr<websocket::stream<tcp::socket>> connectClient(const std::string& token) {
        auto ws = std::make_unique<websocket::stream<tcp::socket>>(ioc_);
        ws->next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server_->port()));
        ws->handshake("127.0.0.1", "/ws?token=" + token);
        return ws;
    }

    /// Читать кадры, пока не придёт кадр нужного типа
    nlohmann::json readUntil(websocket::stream<tcp::socket>& ws, const std::string& type) {
        for (int i = 0; i < 16; ++i) {
            beast::flat_buffer buffer;
            ws.read(buffer);
            auto frame = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
            if (frame["type"] == type) {
                return frame;
            }
        }
        ADD_FAILURE() << "no '" << type << "' frame";
        return nlohmann::json();
    }

    bool waitForConnections(std::size_t expected) {
        for (int i = 0; i < 200; ++i) {
            if (hub_->connectionCount() == expected) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }

    net::io_context ioc_;
    std::shared_ptr<InMemoryCredentialStore> store_;
    std::shared_ptr<application::ConnectionHub> hub_;
    std::shared_ptr<application::PairingService> pairing_;
    std::shared_ptr<WebSocketServer> server_;
};

TEST_F(WebSocketServerTest, StartStop_EphemeralPort) {
    server_->start();
    EXPECT_TRUE(server_->isRunning());
    EXPECT_NE(server_->port(), 0);

    server_->stop();
    EXPECT_FALSE(server_->isRunning());
    server_->stop();
}

TEST_F(WebSocketServerTest, MasterKey_RegistersOperatorAndReceivesBroadcast) {
    server_->start();
    auto ws = connectClient(store_->masterKey());

    ASSERT_TRUE(waitForConnections(1));
    EXPECT_EQ(hub_->countByRole(domain::ConnectionRole::OPERATOR), 1u);

    hub_->broadcast(domain::ServerEvent::serverStatus("running", "1.0.0"));

    beast::flat_buffer buffer;
    ws->read(buffer);
    auto frame = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(frame["type"], "server_status");
    EXPECT_EQ(frame["data"]["status"], "running");

    ws->close(websocket::close_code::normal);
    EXPECT_TRUE(waitForConnections(0));
}

TEST_F(WebSocketServerTest, DeviceKey_RegistersMobile) {
    auto device = store_->addApproved("dev-1");
    server_->start();
    auto ws = connectClient(device.apiKey);

    ASSERT_TRUE(waitForConnections(1));
    EXPECT_EQ(hub_->countByRole(domain::ConnectionRole::MOBILE), 1u);
    ws->close(websocket::close_code::normal);
}

TEST_F(WebSocketServerTest, InvalidToken_ClosedWithPolicyError) {
    server_->start();
    auto ws = connectClient("00000000-0000-4000-8000-000000000000");

    beast::flat_buffer buffer;
    beast::error_code ec;
    ws->read(buffer, ec);

    EXPECT_EQ(ec, websocket::error::closed);
    EXPECT_EQ(ws->reason().code, websocket::close_code::policy_error);
    EXPECT_EQ(hub_->connectionCount(), 0u);
}

TEST_F(WebSocketServerTest, MalformedClientFrame_ConnectionSurvives) {
    server_->start();
    auto ws = connectClient(store_->masterKey());
    ASSERT_TRUE(waitForConnections(1));

    ws->write(net::buffer(std::string("{ not json")));
    ws->write(net::buffer(std::string(R"({"type":"mouse_move","data":{"dx":1}})")));
    hub_->broadcast(domain::ServerEvent::notification("t", "still here", "now"));

    beast::flat_buffer buffer;
    ws->read(buffer);
    auto frame = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(frame["data"]["message"], "still here");
    EXPECT_EQ(hub_->connectionCount(), 1u);
}

TEST_F(WebSocketServerTest, OperatorDecidesPairingOverChannel) {
    server_->start();
    auto ws = connectClient(store_->masterKey());
    ASSERT_TRUE(waitForConnections(1));

    domain::DeviceRegistration registration;
    registration.deviceId = "ws-paired-device";
    registration.deviceName = "Tablet";
    registration.ip = "10.0.0.9";
    auto pending = std::async(std::launch::async, [this, registration]() {
        return pairing_->requestPairing(registration);
    });

    auto request = readUntil(*ws, "pairing_request");
    std::string pairingId = request["data"]["pairing_id"];
    nlohmann::json decision{{"type", "pairing_decision"},
                            {"data", {{"pairing_id", pairingId}, {"approved", true}}}};
    ws->write(net::buffer(decision.dump()));

    auto reply = readUntil(*ws, "pairing_decision");
    EXPECT_EQ(reply["data"]["status"], "approved");
    EXPECT_EQ(reply["data"]["pairing_id"], pairingId);

    auto result = pending.get();
    EXPECT_EQ(result.outcome, ports::input::PairingOutcome::APPROVED);
    EXPECT_FALSE(result.apiKey.empty());

    nlohmann::json late{{"type", "pairing_decision"},
                        {"data", {{"pairing_id", pairingId}, {"approved", false}}}};
    ws->write(net::buffer(late.dump()));
    EXPECT_EQ(readUntil(*ws, "pairing_decision")["data"]["status"], "not_found");
}

TEST_F(WebSocketServerTest, MobileCannotDecidePairing) {
    auto device = store_->addApproved("dev-1");
    server_->start();
    auto ws = connectClient(device.apiKey);
    ASSERT_TRUE(waitForConnections(1));

    nlohmann::json decision{{"type", "pairing_decision"},
                            {"data", {{"pairing_id", "anything"}, {"approved", true}}}};
    ws->write(net::buffer(decision.dump()));

    auto reply = readUntil(*ws, "pairing_decision");
    EXPECT_EQ(reply["data"]["status"], "forbidden");
    EXPECT_EQ(reply["data"]["approved"], false);
}

TEST(WebSocketServerAcceptRetryTest, DelayDoublesUpToOneSecond) {
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(0), 0ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(1), 50ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(2), 100ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(3), 200ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(5), 800ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(6), 1000ms);
    EXPECT_EQ(WebSocketServer::acceptRetryDelay(1000), 1000ms);
}
