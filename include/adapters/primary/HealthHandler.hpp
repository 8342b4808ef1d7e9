#pragma once

#include "adapters/primary/HttpSupport.hpp"

#include <IHttpHandler.hpp>
#include <iostream>

namespace hostlink::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервера
 *
 * Endpoint: GET /health (без ключа)
 */
class HealthHandler : public IHttpHandler {
public:
    HealthHandler()
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "hostlink-service";
        response["version"] = HOSTLINK_VERSION;
        sendJson(res, 200, response);
    }
};

/**
 * @brief GET /ping - проверка ключа клиентом
 */
class PingHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override
    {
        sendJson(res, 200, {{"status", "pong"}});
    }
};

} // namespace hostlink::adapters::primary
