#pragma once

#include "domain/ClientIdentity.hpp"
#include "domain/Errors.hpp"

#include <IRequest.hpp>
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace hostlink::adapters::primary {

/// Атрибуты запроса, которые выставляет ApiKeyMiddleware
inline constexpr const char* ATTR_CLIENT_ID = "clientId";
inline constexpr const char* ATTR_DEVICE_ID = "deviceId";
inline constexpr const char* ATTR_IS_MASTER = "isMaster";

inline void sendJson(IResponse& res, int status, const nlohmann::json& body)
{
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message)
{
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Ответ на доменную ошибку: {"error": ...} со статусом по ErrorKind
 *
 * Для конфликта имён добавляется suggested_name.
 */
inline void sendError(IResponse& res, const domain::HostLinkError& e)
{
    nlohmann::json error;
    error["error"] = e.what();
    if (auto conflict = dynamic_cast<const domain::ConflictError*>(&e)) {
        if (!conflict->suggestedName().empty()) {
            error["conflict"] = true;
            error["suggested_name"] = conflict->suggestedName();
        }
    }
    res.setResult(e.httpStatus(), "application/json", error.dump());
}

/**
 * @brief Кто вызывает (после ApiKeyMiddleware)
 */
inline domain::ClientIdentity callerIdentity(IRequest& req)
{
    domain::ClientIdentity identity;
    identity.clientId = req.getAttribute(ATTR_CLIENT_ID).value_or("");
    identity.deviceId = req.getAttribute(ATTR_DEVICE_ID).value_or("");
    identity.isMaster = req.getAttribute(ATTR_IS_MASTER).value_or("") == "true";
    return identity;
}

/**
 * @brief Разобрать тело как JSON-объект
 * @throws nlohmann::json::exception если тело не JSON
 * @throws ValidationError если это не объект
 */
inline nlohmann::json parseObject(IRequest& req)
{
    auto body = nlohmann::json::parse(req.getBody());
    if (!body.is_object()) {
        throw domain::ValidationError("Request body must be a JSON object");
    }
    return body;
}

/**
 * @brief Обязательное строковое поле
 * @throws ValidationError если поля нет или оно пустое
 */
inline std::string requireString(const nlohmann::json& body, const std::string& field)
{
    auto it = body.find(field);
    if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw domain::ValidationError(field + " is required");
    }
    return it->get<std::string>();
}

} // namespace hostlink::adapters::primary
