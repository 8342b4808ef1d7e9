#pragma once

#include "Timestamp.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace hostlink::domain {

/**
 * @brief Смена адреса устройства
 */
struct IpChange {
    std::string oldIp;
    std::string newIp;
    Timestamp at;
};

/**
 * @brief Сопряжённое или ожидающее одобрения устройство
 *
 * apiKey пуст, пока оператор не одобрил устройство. Неодобренное
 * устройство никогда не проходит аутентификацию.
 */
struct Device {
    std::string deviceId;       ///< UUID, генерирует клиент
    std::string deviceName;
    std::string platform;
    std::string clientVersion;
    std::string fingerprint;    ///< идентификатор установки на стороне клиента
    std::string apiKey;         ///< выдаётся сервером только при одобрении
    bool isApproved = false;
    std::string currentIp;
    Timestamp lastSeen;
    Timestamp createdAt;
    std::vector<IpChange> ipHistory;  ///< от старых к новым, не длиннее MAX_IP_HISTORY

    static constexpr std::size_t MAX_IP_HISTORY = 100;

    /**
     * @brief Запомнить новый адрес
     *
     * Смена пишется в историю, только если прежний адрес был известен.
     * @return true если адрес изменился
     */
    bool recordIp(const std::string& ip) {
        if (ip.empty() || ip == currentIp) {
            return false;
        }
        if (!currentIp.empty()) {
            ipHistory.push_back(IpChange{currentIp, ip, Timestamp::now()});
            if (ipHistory.size() > MAX_IP_HISTORY) {
                ipHistory.erase(ipHistory.begin(), ipHistory.end() - MAX_IP_HISTORY);
            }
        }
        currentIp = ip;
        return true;
    }

    /**
     * @brief Устройство считается онлайн, если виделось за последние 5 минут
     */
    bool isOnline() const {
        return lastSeen.secondsAgo() < 300;
    }
};

/**
 * @brief Входные данные для регистрации кандидата на сопряжение
 */
struct DeviceRegistration {
    std::string deviceId;
    std::string deviceName;
    std::string fingerprint;
    std::string platform;
    std::string clientVersion;
    std::string ip;
};

} // namespace hostlink::domain
