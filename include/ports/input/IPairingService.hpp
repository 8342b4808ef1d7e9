#pragma once

#include "domain/Device.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace hostlink::ports::input {

/**
 * @brief Чем закончилось рукопожатие
 */
enum class PairingOutcome {
    APPROVED,
    DENIED,
    TIMED_OUT
};

/**
 * @brief Результат /pairing/request
 */
struct PairingResult {
    PairingOutcome outcome = PairingOutcome::DENIED;
    std::string pairingId;
    std::string deviceId;
    std::string apiKey;                          ///< только для APPROVED
    std::optional<std::string> certFingerprint;  ///< только для APPROVED
};

/**
 * @brief Результат решения оператора
 */
struct DecisionResult {
    bool recorded = false;  ///< false если решение уже было принято раньше
    bool approved = false;  ///< итоговое (первое) решение
};

/**
 * @brief Что оператор показывает в QR-коде для сопряжения
 */
struct PairingInvitation {
    std::string apiKey;
    std::optional<std::string> certFingerprint;
};

/**
 * @brief Координатор сопряжения
 *
 * Requested -> {Approved, Denied, TimedOut}. Запрос блокирует только
 * вызывающий поток, пока оператор не решит или не истечёт таймаут.
 */
class IPairingService {
public:
    virtual ~IPairingService() = default;

    /**
     * @brief Зарегистрировать кандидата, разослать pairing_request и ждать решения
     * @throws ValidationError если пустое имя устройства
     */
    virtual PairingResult requestPairing(const domain::DeviceRegistration& registration) = 0;

    /**
     * @brief Записать решение оператора (учитывается только первое)
     * @throws NotFoundError если pairing_id неизвестен или уже завершён
     */
    virtual DecisionResult decide(const std::string& pairingId, bool approved) = 0;

    virtual std::size_t pendingCount() const = 0;

    /**
     * @brief Мастер-ключ и отпечаток сертификата для QR-кода оператора
     */
    virtual PairingInvitation invitation() = 0;
};

} // namespace hostlink::ports::input
