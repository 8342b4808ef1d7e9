#pragma once

#include <string>

namespace hostlink::domain {

/**
 * @brief Роль живого соединения: консоль оператора или мобильный клиент
 */
enum class ConnectionRole {
    OPERATOR,
    MOBILE
};

inline std::string toString(ConnectionRole role) {
    return role == ConnectionRole::OPERATOR ? "operator" : "mobile";
}

} // namespace hostlink::domain
