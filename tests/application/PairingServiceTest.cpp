/**
 * @file PairingServiceTest.cpp
 * @brief Unit-тесты координатора сопряжения
 *
 * Оператора изображает RecordingBroadcaster::onEvent: он получает
 * pairing_request синхронно и сразу вызывает decide().
 */

#include <gtest/gtest.h>

#include "application/Authenticator.hpp"
#include "application/PairingService.hpp"
#include "mocks/FakeCertificateInfo.hpp"
#include "mocks/InMemoryCredentialStore.hpp"
#include "mocks/InlineExecutor.hpp"
#include "mocks/RecordingBroadcaster.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <vector>

using namespace hostlink;
using namespace hostlink::application;
using namespace hostlink::ports::input;
using namespace hostlink::tests;
using namespace std::chrono_literals;

class PairingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryCredentialStore>();
        broadcaster_ = std::make_shared<RecordingBroadcaster>();
        certificate_ = std::make_shared<FakeCertificateInfo>(std::string(64, 'f'));
        settings_ = std::make_shared<settings::PairingSettings>();
        settings_->setTimeout(2s);
        service_ = std::make_shared<PairingService>(store_, broadcaster_, certificate_, settings_);
    }

    domain::DeviceRegistration registration(const std::string& name = "Pixel 8",
                                            const std::string& deviceId = "11111111-2222-4333-8444-555555555555") {
        domain::DeviceRegistration r;
        r.deviceName = name;
        r.deviceId = deviceId;
        r.fingerprint = "fp-123";
        r.platform = "android";
        r.clientVersion = "2.1.0";
        r.ip = "192.168.1.50";
        return r;
    }

    /// Оператор отвечает на каждый pairing_request
    void operatorAnswers(bool approved) {
        broadcaster_->onEvent = [this, approved](const domain::ServerEvent& event) {
            if (event.type == "pairing_request") {
                service_->decide(event.data["pairing_id"].get<std::string>(), approved);
            }
        };
    }

    std::shared_ptr<InMemoryCredentialStore> store_;
    std::shared_ptr<RecordingBroadcaster> broadcaster_;
    std::shared_ptr<FakeCertificateInfo> certificate_;
    std::shared_ptr<settings::PairingSettings> settings_;
    std::shared_ptr<PairingService> service_;
};

// ============================================================================
// Одобрение
// ============================================================================

TEST_F(PairingServiceTest, Approve_IssuesKeyAndFingerprint) {
    operatorAnswers(true);

    auto result = service_->requestPairing(registration());

    EXPECT_EQ(result.outcome, PairingOutcome::APPROVED);
    EXPECT_EQ(result.apiKey.size(), 36u);
    ASSERT_TRUE(result.certFingerprint.has_value());
    EXPECT_EQ(*result.certFingerprint, std::string(64, 'f'));
    EXPECT_EQ(result.deviceId, "11111111-2222-4333-8444-555555555555");

    auto stored = store_->findById(result.deviceId);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->isApproved);
    EXPECT_EQ(stored->apiKey, result.apiKey);
    EXPECT_EQ(service_->pendingCount(), 0u);
}

TEST_F(PairingServiceTest, Approve_KeyAuthenticatesAfterwards) {
    operatorAnswers(true);
    auto result = service_->requestPairing(registration());

    Authenticator authenticator(store_, std::make_shared<InlineExecutor>());
    auto identity = authenticator.authenticate(result.apiKey, "192.168.1.50");

    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->deviceId, result.deviceId);
    EXPECT_FALSE(identity->isMaster);
}

TEST_F(PairingServiceTest, Approve_BroadcastsRequestThenNotification) {
    operatorAnswers(true);
    service_->requestPairing(registration());

    auto events = broadcaster_->events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, "pairing_request");
    EXPECT_EQ(events[0].data["device_name"], "Pixel 8");
    EXPECT_EQ(events[0].data["platform"], "android");
    EXPECT_EQ(events[0].data["ip"], "192.168.1.50");
    EXPECT_EQ(events[1].type, "notification");
}

TEST_F(PairingServiceTest, NoCertificate_FingerprintAbsent) {
    certificate_ = std::make_shared<FakeCertificateInfo>(std::nullopt);
    service_ = std::make_shared<PairingService>(store_, broadcaster_, certificate_, settings_);
    operatorAnswers(true);

    auto result = service_->requestPairing(registration());

    EXPECT_EQ(result.outcome, PairingOutcome::APPROVED);
    EXPECT_FALSE(result.certFingerprint.has_value());
}

TEST_F(PairingServiceTest, MissingDeviceId_Generated) {
    operatorAnswers(true);

    auto result = service_->requestPairing(registration("Tablet", ""));

    EXPECT_EQ(result.deviceId.size(), 36u);
    EXPECT_TRUE(store_->findById(result.deviceId).has_value());
}

// ============================================================================
// Отказ и таймаут
// ============================================================================

TEST_F(PairingServiceTest, Deny_RemovesCandidate) {
    operatorAnswers(false);

    auto result = service_->requestPairing(registration());

    EXPECT_EQ(result.outcome, PairingOutcome::DENIED);
    EXPECT_TRUE(result.apiKey.empty());
    EXPECT_FALSE(store_->findById(result.deviceId).has_value());
    EXPECT_TRUE(broadcaster_->eventsOfType("notification").empty());
}

TEST_F(PairingServiceTest, Timeout_RemovesCandidate) {
    settings_->setTimeout(50ms);

    auto started = std::chrono::steady_clock::now();
    auto result = service_->requestPairing(registration());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.outcome, PairingOutcome::TIMED_OUT);
    EXPECT_GE(elapsed, 50ms);
    EXPECT_FALSE(store_->findById(result.deviceId).has_value());
    EXPECT_EQ(service_->pendingCount(), 0u);
}

TEST_F(PairingServiceTest, DecideAfterTimeout_NotFound) {
    settings_->setTimeout(20ms);
    auto result = service_->requestPairing(registration());

    EXPECT_THROW(service_->decide(result.pairingId, true), domain::NotFoundError);
}

TEST_F(PairingServiceTest, BlankName_ValidationError) {
    EXPECT_THROW(service_->requestPairing(registration("   ")), domain::ValidationError);
    EXPECT_TRUE(broadcaster_->events().empty());
    EXPECT_TRUE(store_->listAll().empty());
}

// ============================================================================
// Решение принимается один раз
// ============================================================================

TEST_F(PairingServiceTest, SecondDecision_Ignored) {
    DecisionResult second;
    broadcaster_->onEvent = [this, &second](const domain::ServerEvent& event) {
        if (event.type == "pairing_request") {
            auto id = event.data["pairing_id"].get<std::string>();
            auto first = service_->decide(id, true);
            EXPECT_TRUE(first.recorded);
            second = service_->decide(id, false);
        }
    };

    auto result = service_->requestPairing(registration());

    EXPECT_EQ(result.outcome, PairingOutcome::APPROVED);
    EXPECT_FALSE(second.recorded);
    EXPECT_TRUE(second.approved);
}

TEST_F(PairingServiceTest, UnknownPairingId_NotFound) {
    EXPECT_THROW(service_->decide("no-such-id", true), domain::NotFoundError);
}

TEST_F(PairingServiceTest, DecisionFromAnotherThread_UnblocksRequest) {
    auto pending = std::async(std::launch::async, [this]() {
        return service_->requestPairing(registration());
    });

    for (int i = 0; i < 200 && broadcaster_->eventsOfType("pairing_request").empty(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(service_->pendingCount(), 1u);

    auto requests = broadcaster_->eventsOfType("pairing_request");
    ASSERT_EQ(requests.size(), 1u);
    auto decision = service_->decide(requests[0].data["pairing_id"].get<std::string>(), true);
    EXPECT_TRUE(decision.recorded);

    auto result = pending.get();
    EXPECT_EQ(result.outcome, PairingOutcome::APPROVED);
}

TEST_F(PairingServiceTest, ConcurrentDecisions_ExactlyOneRecorded) {
    constexpr int deciders = 16;
    constexpr int rounds = 20;

    for (int round = 0; round < rounds; ++round) {
        const std::string deviceId = "race-device-" + std::to_string(round);
        broadcaster_->clear();
        auto pending = std::async(std::launch::async, [this, &deviceId]() {
            return service_->requestPairing(registration("Race", deviceId));
        });

        for (int i = 0; i < 400 && broadcaster_->eventsOfType("pairing_request").empty(); ++i) {
            std::this_thread::sleep_for(5ms);
        }
        auto requests = broadcaster_->eventsOfType("pairing_request");
        ASSERT_EQ(requests.size(), 1u) << "round " << round;
        const std::string pairingId = requests[0].data["pairing_id"].get<std::string>();

        // чётные потоки одобряют, нечётные отклоняют, стартуют одновременно
        std::atomic<bool> go{false};
        std::vector<std::optional<DecisionResult>> results(deciders);
        std::vector<std::thread> threads;
        for (int t = 0; t < deciders; ++t) {
            threads.emplace_back([&, t]() {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                try {
                    results[t] = service_->decide(pairingId, t % 2 == 0);
                } catch (const domain::NotFoundError&) {
                    // запрос уже завершился, решение не записано
                }
            });
        }
        go = true;
        for (auto& thread : threads) {
            thread.join();
        }

        int recorded = 0;
        bool winnerApproved = false;
        for (int t = 0; t < deciders; ++t) {
            if (results[t] && results[t]->recorded) {
                ++recorded;
                winnerApproved = (t % 2 == 0);
            }
        }
        ASSERT_EQ(recorded, 1) << "round " << round;
        for (const auto& result : results) {
            if (result) {
                EXPECT_EQ(result->approved, winnerApproved) << "round " << round;
            }
        }

        auto outcome = pending.get();
        auto stored = store_->findById(deviceId);
        if (winnerApproved) {
            EXPECT_EQ(outcome.outcome, PairingOutcome::APPROVED) << "round " << round;
            ASSERT_TRUE(stored.has_value());
            EXPECT_TRUE(stored->isApproved);
        } else {
            EXPECT_EQ(outcome.outcome, PairingOutcome::DENIED) << "round " << round;
            EXPECT_FALSE(stored.has_value());
        }
        EXPECT_EQ(service_->pendingCount(), 0u);
    }
}

TEST_F(PairingServiceTest, Invitation_MasterKeyAndFingerprint) {
    auto invitation = service_->invitation();

    EXPECT_EQ(invitation.apiKey, store_->masterKey());
    ASSERT_TRUE(invitation.certFingerprint.has_value());
    EXPECT_EQ(*invitation.certFingerprint, std::string(64, 'f'));
}
