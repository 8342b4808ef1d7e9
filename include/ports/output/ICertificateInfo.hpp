#pragma once

#include <optional>
#include <string>

namespace hostlink::ports::output {

/**
 * @brief Сведения о TLS-сертификате сервера для pinning на клиенте
 */
class ICertificateInfo {
public:
    virtual ~ICertificateInfo() = default;

    /**
     * @brief SHA-256 отпечаток сертификата (hex, нижний регистр)
     * @return nullopt, если сертификат не настроен или не читается
     */
    virtual std::optional<std::string> fingerprint() = 0;
};

} // namespace hostlink::ports::output
