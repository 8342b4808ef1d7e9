#pragma once

#include <stdexcept>
#include <string>

namespace hostlink::domain {

/**
 * @brief Категория ошибки, определяет HTTP статус ответа
 */
enum class ErrorKind {
    VALIDATION,          ///< некорректный ввод
    AUTH,                ///< нет/неверный/неодобренный ключ
    NOT_FOUND,           ///< неизвестная сессия, устройство, pairing_id
    CONFLICT,            ///< коллизия имён, файл изменился под нами
    TIMEOUT,             ///< истёк срок ожидания решения оператора
    RANGE_NOT_SATISFIABLE,
    INTERNAL             ///< неожиданная ошибка ввода-вывода
};

inline int toHttpStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:            return 400;
        case ErrorKind::AUTH:                  return 403;
        case ErrorKind::NOT_FOUND:             return 404;
        case ErrorKind::CONFLICT:              return 409;
        case ErrorKind::TIMEOUT:               return 408;
        case ErrorKind::RANGE_NOT_SATISFIABLE: return 416;
        case ErrorKind::INTERNAL:              return 500;
    }
    return 500;
}

/**
 * @brief Базовое исключение домена
 *
 * Сервисы бросают наследников, primary-адаптеры ловят HostLinkError
 * и отвечают {"error": what()} со статусом toHttpStatus(kind()).
 */
class HostLinkError : public std::runtime_error {
public:
    HostLinkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    int httpStatus() const { return toHttpStatus(kind_); }

private:
    ErrorKind kind_;
};

class ValidationError : public HostLinkError {
public:
    explicit ValidationError(const std::string& message)
        : HostLinkError(ErrorKind::VALIDATION, message) {}
};

class AuthError : public HostLinkError {
public:
    explicit AuthError(const std::string& message = "Invalid API Key")
        : HostLinkError(ErrorKind::AUTH, message) {}
};

class NotFoundError : public HostLinkError {
public:
    explicit NotFoundError(const std::string& message)
        : HostLinkError(ErrorKind::NOT_FOUND, message) {}
};

/**
 * @brief Конфликт. Для коллизии имён несёт предлагаемое имя (keep_both)
 */
class ConflictError : public HostLinkError {
public:
    explicit ConflictError(const std::string& message, std::string suggestedName = "")
        : HostLinkError(ErrorKind::CONFLICT, message)
        , suggestedName_(std::move(suggestedName)) {}

    const std::string& suggestedName() const { return suggestedName_; }

private:
    std::string suggestedName_;
};

class TimeoutError : public HostLinkError {
public:
    explicit TimeoutError(const std::string& message)
        : HostLinkError(ErrorKind::TIMEOUT, message) {}
};

class RangeNotSatisfiableError : public HostLinkError {
public:
    explicit RangeNotSatisfiableError(const std::string& message)
        : HostLinkError(ErrorKind::RANGE_NOT_SATISFIABLE, message) {}
};

class InternalError : public HostLinkError {
public:
    explicit InternalError(const std::string& message)
        : HostLinkError(ErrorKind::INTERNAL, message) {}
};

} // namespace hostlink::domain
