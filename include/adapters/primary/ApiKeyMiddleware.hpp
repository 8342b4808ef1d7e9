#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IAuthenticator.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>

namespace hostlink::adapters::primary {

/**
 * @brief Middleware проверки x-api-key
 *
 * Пропускает мастер-ключ и ключи одобренных устройств, кладёт личность
 * вызывающего в атрибуты запроса. Любой отказ (нет заголовка, чужой,
 * неодобренный, отозванный ключ) - одинаковый 403 "Invalid API Key".
 */
class ApiKeyMiddleware : public IHttpHandler {
public:
    explicit ApiKeyMiddleware(std::shared_ptr<ports::input::IAuthenticator> authenticator)
        : authenticator_(std::move(authenticator))
    {
        std::cout << "[ApiKeyMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        std::string apiKey = req.getHeader("x-api-key").value_or("");
        auto identity = authenticator_->authenticate(apiKey, req.getIp());
        if (!identity) {
            sendError(res, 403, "Invalid API Key");
            return;
        }

        req.setAttribute(ATTR_CLIENT_ID, identity->clientId);
        req.setAttribute(ATTR_DEVICE_ID, identity->deviceId);
        req.setAttribute(ATTR_IS_MASTER, identity->isMaster ? "true" : "false");
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<ports::input::IAuthenticator> authenticator_;
};

/**
 * @brief Middleware: дальше проходит только мастер-ключ
 *
 * Ставится после ApiKeyMiddleware.
 */
class MasterKeyOnlyMiddleware : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override
    {
        if (!callerIdentity(req).isMaster) {
            sendError(res, 403, "Invalid API Key");
            return;
        }
        res.setStatus(0);
    }
};

} // namespace hostlink::adapters::primary
