#pragma once

#include <string>

namespace hostlink::ports::output {

/**
 * @brief Проверка путей и имён файлов, пришедших от клиента
 *
 * Все методы бросают ValidationError при нарушении.
 */
class IPathValidator {
public:
    virtual ~IPathValidator() = default;

    /**
     * @brief Разрешить путь и убедиться, что он внутри разрешённых корней
     *
     * Относительные пути разрешаются от домашнего каталога, ".." запрещено.
     * @return Канонический абсолютный путь
     */
    virtual std::string resolve(const std::string& path) = 0;

    /**
     * @brief Проверить имя файла (без разделителей пути и служебных символов)
     * @return То же имя
     */
    virtual std::string validateFileName(const std::string& fileName) = 0;
};

} // namespace hostlink::ports::output
