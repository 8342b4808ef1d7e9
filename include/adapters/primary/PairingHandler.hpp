#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPairingService.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace hostlink::adapters::primary {

/**
 * @brief HTTP Handler сопряжения
 *
 * Endpoints:
 * - POST /pairing/request  (публичный, держит соединение до решения оператора)
 * - POST /pairing/approve  (мастер-ключ)
 * - POST /pairing/deny     (мастер-ключ)
 *
 * POST /pairing/request
 *   {"device_name": "Pixel 8", "device_id": "...", "device_fingerprint": "...",
 *    "client_version": "2.1.0", "platform": "android"}
 *
 * Response (200 OK):
 *   {"status": "approved", "api_key": "...", "device_id": "...",
 *    "cert_fingerprint": "ab12..." | null}
 *
 * Errors:
 *   400 - нет device_name или невалидный JSON
 *   403 - оператор отклонил запрос
 *   408 - оператор не ответил вовремя
 */
class PairingHandler : public IHttpHandler {
public:
    explicit PairingHandler(std::shared_ptr<ports::input::IPairingService> pairingService)
        : pairingService_(std::move(pairingService))
    {
        std::cout << "[PairingHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            const std::string path = req.getPath();
            if (req.getMethod() != "POST") {
                sendError(res, 405, "Method not allowed");
            } else if (path == "/pairing/request") {
                handleRequest(req, res);
            } else if (path == "/pairing/approve") {
                handleDecision(req, res, std::nullopt);
            } else if (path == "/pairing/deny") {
                handleDecision(req, res, false);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const domain::HostLinkError& e) {
            sendError(res, e);
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[PairingHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPairingService> pairingService_;

    void handleRequest(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);

        domain::DeviceRegistration registration;
        registration.deviceName = body.value("device_name", "");
        registration.deviceId = body.value("device_id", "");
        registration.fingerprint = body.value("device_fingerprint", "");
        registration.platform = body.value("platform", "");
        registration.clientVersion = body.value("client_version", "");
        registration.ip = req.getIp();

        auto result = pairingService_->requestPairing(registration);

        switch (result.outcome) {
            case ports::input::PairingOutcome::APPROVED: {
                nlohmann::json response;
                response["status"] = "approved";
                response["api_key"] = result.apiKey;
                response["device_id"] = result.deviceId;
                response["cert_fingerprint"] = result.certFingerprint
                    ? nlohmann::json(*result.certFingerprint)
                    : nlohmann::json(nullptr);
                sendJson(res, 200, response);
                break;
            }
            case ports::input::PairingOutcome::DENIED:
                sendError(res, 403, "Pairing request denied");
                break;
            case ports::input::PairingOutcome::TIMED_OUT:
                sendError(res, domain::TimeoutError("Pairing request timed out"));
                break;
        }
    }

    /**
     * @param forced false для /deny; для /approve решение берётся из поля approved
     */
    void handleDecision(IRequest& req, IResponse& res, std::optional<bool> forced)
    {
        auto body = parseObject(req);
        std::string pairingId = requireString(body, "pairing_id");
        bool approved = forced.has_value() ? *forced : body.value("approved", true);

        auto result = pairingService_->decide(pairingId, approved);

        nlohmann::json response;
        response["status"] = result.recorded ? (result.approved ? "approved" : "denied")
                                             : "already_decided";
        response["approved"] = result.approved;
        sendJson(res, 200, response);
    }
};

} // namespace hostlink::adapters::primary
