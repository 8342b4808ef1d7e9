#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPairingService.hpp"
#include "settings/ServerSettings.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace hostlink::adapters::primary {

/**
 * @brief GET /qr-payload (мастер-ключ)
 *
 * Response (200 OK):
 *   {"protocol": "https", "ip": "192.168.1.20", "port": 38080,
 *    "apiKey": "...", "certFingerprint": "ab12..." | null}
 */
class QrPayloadHandler : public IHttpHandler {
public:
    QrPayloadHandler(std::shared_ptr<ports::input::IPairingService> pairingService,
                     std::shared_ptr<settings::ServerSettings> settings)
        : pairingService_(std::move(pairingService))
        , settings_(std::move(settings))
    {
        std::cout << "[QrPayloadHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            auto invitation = pairingService_->invitation();

            nlohmann::json response;
            response["protocol"] = settings_->getProtocol();
            response["ip"] = settings_->getAdvertisedIp();
            response["port"] = settings_->getPort();
            response["apiKey"] = invitation.apiKey;
            response["certFingerprint"] = invitation.certFingerprint
                ? nlohmann::json(*invitation.certFingerprint)
                : nlohmann::json(nullptr);
            sendJson(res, 200, response);
        } catch (const std::exception& e) {
            std::cerr << "[QrPayloadHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPairingService> pairingService_;
    std::shared_ptr<settings::ServerSettings> settings_;
};

} // namespace hostlink::adapters::primary
