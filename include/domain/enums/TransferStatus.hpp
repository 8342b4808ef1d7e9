#pragma once

#include <stdexcept>
#include <string>

namespace hostlink::domain {

/**
 * @brief Статус сессии передачи файла
 */
enum class TransferStatus {
    ACTIVE,     ///< Принимает/отдаёт чанки
    PAUSED,     ///< Приостановлена клиентом
    COMPLETED,  ///< Завершена (upload перенесён в итоговый путь)
    CANCELLED   ///< Отменена клиентом или сломалась
};

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::ACTIVE:    return "active";
        case TransferStatus::PAUSED:    return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TransferStatus transferStatusFromString(const std::string& str) {
    if (str == "active")    return TransferStatus::ACTIVE;
    if (str == "paused")    return TransferStatus::PAUSED;
    if (str == "completed") return TransferStatus::COMPLETED;
    if (str == "cancelled") return TransferStatus::CANCELLED;
    throw std::invalid_argument("Unknown TransferStatus: " + str);
}

/**
 * @brief Сессия ещё может принимать операции над данными
 */
inline bool isOpenStatus(TransferStatus status) {
    return status == TransferStatus::ACTIVE || status == TransferStatus::PAUSED;
}

} // namespace hostlink::domain
