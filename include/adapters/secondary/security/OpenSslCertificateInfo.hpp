#pragma once

#include "ports/output/ICertificateInfo.hpp"
#include "settings/SecuritySettings.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hostlink::adapters::secondary {

/**
 * @brief SHA-256 отпечаток PEM-сертификата (security.cert_file) через OpenSSL
 *
 * Отпечаток считается один раз и кешируется.
 */
class OpenSslCertificateInfo : public ports::output::ICertificateInfo {
public:
    explicit OpenSslCertificateInfo(std::shared_ptr<settings::SecuritySettings> settings);

    std::optional<std::string> fingerprint() override;

    /**
     * @brief Посчитать отпечаток файла без кеширования
     */
    static std::optional<std::string> computeFingerprint(const std::string& pemPath);

private:
    std::string certFile_;
    std::once_flag computed_;
    std::optional<std::string> fingerprint_;
};

} // namespace hostlink::adapters::secondary
