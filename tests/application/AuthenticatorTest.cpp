/**
 * @file AuthenticatorTest.cpp
 * @brief Unit-тесты проверки x-api-key
 */

#include <gtest/gtest.h>

#include "application/Authenticator.hpp"
#include "mocks/InMemoryCredentialStore.hpp"
#include "mocks/InlineExecutor.hpp"

using namespace hostlink;
using namespace hostlink::application;
using namespace hostlink::tests;

class AuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryCredentialStore>();
        executor_ = std::make_shared<InlineExecutor>();
        authenticator_ = std::make_shared<Authenticator>(store_, executor_);
    }

    std::shared_ptr<InMemoryCredentialStore> store_;
    std::shared_ptr<InlineExecutor> executor_;
    std::shared_ptr<Authenticator> authenticator_;
};

TEST_F(AuthenticatorTest, MasterKey_IsMaster) {
    auto identity = authenticator_->authenticate(store_->masterKey(), "10.0.0.1");

    ASSERT_TRUE(identity.has_value());
    EXPECT_TRUE(identity->isMaster);
    EXPECT_EQ(identity->clientId, store_->masterKey());
    EXPECT_TRUE(identity->deviceId.empty());
    EXPECT_EQ(executor_->postedCount(), 0);
}

TEST_F(AuthenticatorTest, ApprovedDevice_IdentityAndTouch) {
    auto device = store_->addApproved("dev-1");

    auto identity = authenticator_->authenticate(device.apiKey, "10.0.0.99");

    ASSERT_TRUE(identity.has_value());
    EXPECT_FALSE(identity->isMaster);
    EXPECT_EQ(identity->clientId, "dev-1");
    EXPECT_EQ(identity->deviceId, "dev-1");
    EXPECT_EQ(store_->touchCount(), 1);
    EXPECT_EQ(store_->findById("dev-1")->currentIp, "10.0.0.99");
}

TEST_F(AuthenticatorTest, UnapprovedDevice_Rejected) {
    auto device = store_->addApproved("dev-1");
    store_->revoke("dev-1");

    domain::DeviceRegistration registration;
    registration.deviceId = "dev-2";
    registration.deviceName = "pending";
    store_->registerDevice(registration);

    EXPECT_FALSE(authenticator_->authenticate(device.apiKey, "10.0.0.1").has_value());
    EXPECT_EQ(store_->touchCount(), 0);
}

TEST_F(AuthenticatorTest, EmptyKey_Rejected) {
    EXPECT_FALSE(authenticator_->authenticate("", "10.0.0.1").has_value());
}

TEST_F(AuthenticatorTest, UnknownKey_Rejected) {
    store_->addApproved("dev-1");
    EXPECT_FALSE(authenticator_->authenticate("00000000-0000-4000-8000-000000000000", "10.0.0.1").has_value());
    EXPECT_FALSE(authenticator_->authenticate("garbage\r\nkey", "10.0.0.1").has_value());
}

TEST_F(AuthenticatorTest, ReapprovedDevice_OldKeyStopsWorking) {
    auto first = store_->addApproved("dev-1");
    auto second = store_->approve("dev-1");

    EXPECT_NE(first.apiKey, second.apiKey);
    EXPECT_FALSE(authenticator_->authenticate(first.apiKey, "10.0.0.1").has_value());
    EXPECT_TRUE(authenticator_->authenticate(second.apiKey, "10.0.0.1").has_value());
}
