#pragma once

#include <string>

namespace hostlink::utils {

/**
 * @brief Подготовить пришедшую от клиента строку к выводу в лог
 *
 * Управляющие символы заменяются пробелами, длина ограничена.
 */
inline std::string sanitizeForLog(const std::string& value, std::size_t maxLength = 256) {
    std::string result = value.substr(0, maxLength);
    for (auto& c : result) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
            c = ' ';
        }
    }
    if (value.size() > maxLength) {
        result += "...";
    }
    return result;
}

/**
 * @brief Первые 8 символов ключа, остальное не логируется никогда
 */
inline std::string maskKey(const std::string& key) {
    return key.substr(0, 8) + "...";
}

} // namespace hostlink::utils
