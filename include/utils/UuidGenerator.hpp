#pragma once

#include "domain/Errors.hpp"

#include <openssl/rand.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace hostlink::utils {

/**
 * @brief Генератор UUID v4 на криптографическом ГСЧ OpenSSL
 *
 * Используется для API-ключей устройств, мастер-ключа и id сессий.
 *
 * @note Thread-safe (RAND_bytes потокобезопасен в OpenSSL >= 1.1)
 */
class UuidGenerator {
public:
    /**
     * @brief Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     * @throws InternalError если ГСЧ не смог выдать байты
     */
    static std::string generate() {
        std::array<unsigned char, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw domain::InternalError("RAND_bytes failed");
        }
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // variant

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    /**
     * @brief Похожа ли строка на UUID (36 символов, дефисы на своих местах)
     *
     * Ключи другой формы отбрасываются до поиска в хранилище.
     */
    static bool isValid(const std::string& value) {
        if (value.size() != 36) {
            return false;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        return true;
    }
};

} // namespace hostlink::utils
