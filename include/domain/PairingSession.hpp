#pragma once

#include "Device.hpp"
#include "Timestamp.hpp"
#include <future>
#include <mutex>
#include <optional>
#include <string>

namespace hostlink::domain {

/**
 * @brief Состояние одного рукопожатия сопряжения
 *
 * Живёт ровно столько, сколько ждёт HTTP-запрос /pairing/request.
 * Решение записывается не больше одного раза: первый decide()
 * выставляет approved и исполняет promise, остальные ничего не меняют.
 */
struct PairingSession {
    std::string pairingId;
    Device candidate;
    Timestamp requestedAt;

    std::mutex mutex;
    std::optional<bool> approved;
    std::promise<bool> decision;

    /**
     * @brief Записать решение, если его ещё нет
     * @return true если это решение первое и принято
     */
    bool decide(bool value) {
        std::lock_guard<std::mutex> lock(mutex);
        if (approved.has_value()) {
            return false;
        }
        approved = value;
        decision.set_value(value);
        return true;
    }

    std::optional<bool> currentDecision() {
        std::lock_guard<std::mutex> lock(mutex);
        return approved;
    }
};

} // namespace hostlink::domain
