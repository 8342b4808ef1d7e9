#pragma once

#include "domain/Errors.hpp"
#include "domain/PairingSession.hpp"
#include "ports/input/IPairingService.hpp"
#include "ports/output/ICertificateInfo.hpp"
#include "ports/output/ICredentialStore.hpp"
#include "ports/output/IEventBroadcaster.hpp"
#include "settings/PairingSettings.hpp"
#include "utils/LogSanitizer.hpp"
#include "utils/UuidGenerator.hpp"

#include <ThreadSafeMap.hpp>
#include <iostream>
#include <memory>

namespace hostlink::application {

/**
 * @brief Координатор сопряжения
 *
 * Протокол не знает, кто показывает запрос человеку: он рассылает
 * pairing_request через IEventBroadcaster и ждёт future, который
 * исполняет decide() (консоль оператора, GUI, автополитика).
 *
 * Зависимости:
 * - ICredentialStore - регистрация/одобрение/удаление кандидата
 * - IEventBroadcaster - уведомление операторов
 * - ICertificateInfo - отпечаток сертификата для pinning
 */
class PairingService : public ports::input::IPairingService {
public:
    PairingService(std::shared_ptr<ports::output::ICredentialStore> store,
                   std::shared_ptr<ports::output::IEventBroadcaster> broadcaster,
                   std::shared_ptr<ports::output::ICertificateInfo> certificate,
                   std::shared_ptr<settings::PairingSettings> settings)
        : store_(std::move(store))
        , broadcaster_(std::move(broadcaster))
        , certificate_(std::move(certificate))
        , settings_(std::move(settings))
    {
        std::cout << "[PairingService] Created, timeout "
                  << settings_->getTimeout().count() << " ms" << std::endl;
    }

    ports::input::PairingResult requestPairing(const domain::DeviceRegistration& registration) override
    {
        if (registration.deviceName.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw domain::ValidationError("Device name is required");
        }

        domain::DeviceRegistration candidate = registration;
        if (candidate.deviceId.empty()) {
            candidate.deviceId = utils::UuidGenerator::generate();
        }

        auto session = std::make_shared<domain::PairingSession>();
        session->pairingId = utils::UuidGenerator::generate();
        session->candidate = store_->registerDevice(candidate);

        auto decision = session->decision.get_future();
        sessions_.insert(session->pairingId, session);
        SessionGuard guard{sessions_, session->pairingId};

        std::cout << "[PairingService] Pairing " << session->pairingId.substr(0, 8) << " requested by '"
                  << utils::sanitizeForLog(candidate.deviceName) << "' from "
                  << utils::sanitizeForLog(candidate.ip, 64) << std::endl;

        broadcaster_->broadcast(domain::ServerEvent::pairingRequest(
            session->pairingId, session->candidate.deviceName, session->candidate.deviceId,
            session->candidate.platform, session->candidate.currentIp));

        ports::input::PairingResult result;
        result.pairingId = session->pairingId;
        result.deviceId = session->candidate.deviceId;

        bool timedOut = false;
        if (decision.wait_for(settings_->getTimeout()) != std::future_status::ready) {
            // закрываем сессию отказом; если decide() успел раньше, берём его решение
            timedOut = session->decide(false);
        }
        bool approved = session->currentDecision().value_or(false);

        if (timedOut || !approved) {
            store_->revoke(result.deviceId);
            result.outcome = timedOut ? ports::input::PairingOutcome::TIMED_OUT
                                      : ports::input::PairingOutcome::DENIED;
            std::cout << "[PairingService] Pairing " << result.pairingId.substr(0, 8)
                      << (timedOut ? " timed out" : " denied") << ", device removed" << std::endl;
            return result;
        }

        auto device = store_->approve(result.deviceId);
        result.outcome = ports::input::PairingOutcome::APPROVED;
        result.apiKey = device.apiKey;
        result.certFingerprint = certificate_->fingerprint();

        std::cout << "[PairingService] Pairing " << result.pairingId.substr(0, 8) << " approved" << std::endl;
        broadcaster_->broadcast(domain::ServerEvent::notification(
            "Device paired", device.deviceName + " was approved", domain::Timestamp::now().toString()));
        return result;
    }

    ports::input::DecisionResult decide(const std::string& pairingId, bool approved) override
    {
        auto session = sessions_.find(pairingId);
        if (!session) {
            throw domain::NotFoundError("Pairing request not found or expired");
        }

        ports::input::DecisionResult result;
        result.recorded = session->decide(approved);
        result.approved = session->currentDecision().value_or(false);

        if (result.recorded) {
            std::cout << "[PairingService] Decision for " << pairingId.substr(0, 8) << ": "
                      << (approved ? "approve" : "deny") << std::endl;
        } else {
            std::cout << "[PairingService] Duplicate decision for " << pairingId.substr(0, 8)
                      << " ignored" << std::endl;
        }
        return result;
    }

    std::size_t pendingCount() const override
    {
        return sessions_.size();
    }

    ports::input::PairingInvitation invitation() override
    {
        return {store_->masterKey(), certificate_->fingerprint()};
    }

private:
    using SessionTable = ThreadSafeMap<std::string, domain::PairingSession>;

    /// Удаляет сессию при любом выходе из requestPairing
    struct SessionGuard {
        SessionTable& table;
        std::string pairingId;
        ~SessionGuard() { table.erase(pairingId); }
    };

    std::shared_ptr<ports::output::ICredentialStore> store_;
    std::shared_ptr<ports::output::IEventBroadcaster> broadcaster_;
    std::shared_ptr<ports::output::ICertificateInfo> certificate_;
    std::shared_ptr<settings::PairingSettings> settings_;

    SessionTable sessions_;
};

} // namespace hostlink::application
