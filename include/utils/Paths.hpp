#pragma once

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace hostlink::utils {

/**
 * @brief Домашний каталог пользователя, от имени которого работает сервис
 */
inline std::string homeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        if (*home != '\0') {
            return home;
        }
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "/";
}

/**
 * @brief Разбить "a, b,c" на {"a","b","c"} (пустые элементы отбрасываются)
 */
inline std::vector<std::string> splitList(const std::string& value, char separator = ',') {
    std::vector<std::string> result;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, separator)) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            result.push_back(item.substr(first, last - first + 1));
        }
    }
    return result;
}

} // namespace hostlink::utils
