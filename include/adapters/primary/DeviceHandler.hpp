#pragma once

#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IDeviceService.hpp"

#include <IHttpHandler.hpp>
#include <iostream>
#include <memory>
#include <regex>

namespace hostlink::adapters::primary {

/**
 * @brief HTTP Handler устройств
 *
 * Endpoints:
 * - GET  /devices              (мастер-ключ) список устройств
 * - POST /devices/{id}/revoke  (мастер-ключ) отзыв ключа
 * - POST /pairing/reconnect    (ключ устройства) переподключение после смены IP
 * - POST /device/ip-change     (ключ устройства) явное уведомление о смене IP
 * - GET  /devices/{id}/ip-history?limit=50  (мастер-ключ) история адресов
 * - POST /announce             (любой ключ) клиент объявляет о себе
 */
class DeviceHandler : public IHttpHandler {
public:
    explicit DeviceHandler(std::shared_ptr<ports::input::IDeviceService> deviceService)
        : deviceService_(std::move(deviceService))
    {
        std::cout << "[DeviceHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        static const std::regex revokeRegex(R"(^/devices/([^/]+)/revoke$)");
        static const std::regex historyRegex(R"(^/devices/([^/]+)/ip-history$)");

        try {
            const std::string method = req.getMethod();
            const std::string path = req.getPath();
            std::smatch matches;

            if (method == "GET" && path == "/devices") {
                handleList(res);
            } else if (method == "POST" && std::regex_match(path, matches, revokeRegex)) {
                handleRevoke(res, matches[1].str());
            } else if (method == "GET" && std::regex_match(path, matches, historyRegex)) {
                handleIpHistory(req, res, matches[1].str());
            } else if (method == "POST" && path == "/announce") {
                handleAnnounce(req, res);
            } else if (method == "POST" && path == "/pairing/reconnect") {
                handleReconnect(req, res);
            } else if (method == "POST" && path == "/device/ip-change") {
                handleIpChange(req, res);
            } else {
                sendError(res, 404, "Not found");
            }
        } catch (const domain::HostLinkError& e) {
            sendError(res, e);
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[DeviceHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IDeviceService> deviceService_;

    void handleList(IResponse& res)
    {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto& device : deviceService_->listDevices()) {
            devices.push_back({
                {"id", device.deviceId.substr(0, 8)},
                {"device_id", device.deviceId},
                {"name", device.deviceName},
                {"platform", device.platform},
                {"client_version", device.clientVersion},
                {"ip", device.currentIp},
                {"last_seen", device.lastSeen.toString()},
                {"is_approved", device.isApproved},
                {"is_online", device.isOnline()}
            });
        }
        nlohmann::json response;
        response["devices"] = devices;
        sendJson(res, 200, response);
    }

    void handleRevoke(IResponse& res, const std::string& deviceId)
    {
        deviceService_->revokeDevice(deviceId);
        nlohmann::json response;
        response["status"] = "revoked";
        response["device_id"] = deviceId;
        sendJson(res, 200, response);
    }

    void handleReconnect(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);
        std::string deviceId = requireString(body, "device_id");
        std::optional<std::string> fingerprint;
        if (body.contains("device_fingerprint") && body["device_fingerprint"].is_string()) {
            fingerprint = body["device_fingerprint"].get<std::string>();
        }

        auto device = deviceService_->reconnect(callerIdentity(req), deviceId, fingerprint, req.getIp());

        nlohmann::json response;
        response["status"] = "reconnected";
        response["device_id"] = device.deviceId;
        response["ip"] = device.currentIp;
        sendJson(res, 200, response);
    }

    void handleIpChange(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);
        std::string deviceId = requireString(body, "device_id");
        std::string newIp = body.value("new_ip", req.getIp());

        auto device = deviceService_->changeIp(callerIdentity(req), deviceId, newIp);

        nlohmann::json response;
        response["status"] = "updated";
        response["device_id"] = device.deviceId;
        response["ip"] = device.currentIp;
        sendJson(res, 200, response);
    }

    void handleIpHistory(IRequest& req, IResponse& res, const std::string& deviceId)
    {
        int limit = 50;
        std::string limitText = req.getQueryParam("limit").value_or("");
        if (!limitText.empty()) {
            if (limitText.size() > 3 || limitText.find_first_not_of("0123456789") != std::string::npos) {
                throw domain::ValidationError("limit must be between 1 and 100");
            }
            limit = std::stoi(limitText);
        }

        nlohmann::json changes = nlohmann::json::array();
        for (const auto& change : deviceService_->ipHistory(deviceId, limit)) {
            changes.push_back({
                {"old_ip", change.oldIp},
                {"new_ip", change.newIp},
                {"timestamp", change.at.toString()}
            });
        }

        nlohmann::json response;
        // полный идентификатор в ответ не попадает
        response["device_id"] = deviceId.substr(0, 8) + "...";
        response["ip_changes"] = changes;
        sendJson(res, 200, response);
    }

    void handleAnnounce(IRequest& req, IResponse& res)
    {
        auto body = parseObject(req);
        std::string name = requireString(body, "name");

        auto result = deviceService_->announce(callerIdentity(req), name, req.getIp());

        nlohmann::json response;
        response["status"] = "announced";
        response["ip"] = result.ip;
        response["name"] = result.name;
        sendJson(res, 200, response);
    }
};

} // namespace hostlink::adapters::primary
