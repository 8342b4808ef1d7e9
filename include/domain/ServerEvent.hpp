#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace hostlink::domain {

/**
 * @brief Событие, которое сервер рассылает всем живым соединениям
 *
 * На проводе: {"type": "...", "data": {...}}
 */
struct ServerEvent {
    std::string type;
    nlohmann::json data = nlohmann::json::object();

    std::string toFrame() const {
        nlohmann::json frame;
        frame["type"] = type;
        frame["data"] = data;
        return frame.dump();
    }

    static ServerEvent pairingRequest(const std::string& pairingId,
                                      const std::string& deviceName,
                                      const std::string& deviceId,
                                      const std::string& platform,
                                      const std::string& ip) {
        ServerEvent event{"pairing_request"};
        event.data["pairing_id"] = pairingId;
        event.data["device_name"] = deviceName;
        event.data["device_id"] = deviceId;
        event.data["platform"] = platform;
        event.data["ip"] = ip;
        return event;
    }

    static ServerEvent update(const nlohmann::json& system) {
        ServerEvent event{"update"};
        event.data["system"] = system;
        return event;
    }

    static ServerEvent serverStatus(const std::string& status, const std::string& version) {
        ServerEvent event{"server_status"};
        event.data["status"] = status;
        event.data["version"] = version;
        return event;
    }

    /// Ответ оператору на pairing_decision, поданный через WebSocket
    static ServerEvent pairingDecision(const std::string& pairingId,
                                       const std::string& status,
                                       bool approved) {
        ServerEvent event{"pairing_decision"};
        event.data["pairing_id"] = pairingId;
        event.data["status"] = status;
        event.data["approved"] = approved;
        return event;
    }

    static ServerEvent notification(const std::string& title,
                                    const std::string& message,
                                    const std::string& timestamp) {
        ServerEvent event{"notification"};
        event.data["title"] = title;
        event.data["message"] = message;
        event.data["timestamp"] = timestamp;
        return event;
    }
};

} // namespace hostlink::domain
