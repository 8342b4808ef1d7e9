#pragma once

#include <stdexcept>
#include <string>

namespace hostlink::domain {

/**
 * @brief Что делать, если файл с таким именем уже есть в каталоге назначения
 */
enum class ConflictPolicy {
    ABORT,      ///< Отказать с 409 и предложить имя
    OVERWRITE,  ///< Перезаписать при complete
    KEEP_BOTH   ///< Добавить суффикс " (N)" до уникальности
};

inline std::string toString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::ABORT:     return "abort";
        case ConflictPolicy::OVERWRITE: return "overwrite";
        case ConflictPolicy::KEEP_BOTH: return "keep_both";
    }
    return "abort";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ConflictPolicy conflictPolicyFromString(const std::string& str) {
    if (str == "abort")     return ConflictPolicy::ABORT;
    if (str == "overwrite") return ConflictPolicy::OVERWRITE;
    if (str == "keep_both") return ConflictPolicy::KEEP_BOTH;
    throw std::invalid_argument("Unknown conflict_resolution: " + str);
}

} // namespace hostlink::domain
