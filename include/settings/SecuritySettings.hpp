#pragma once

#include <IEnvironment.hpp>
#include <memory>
#include <string>

namespace hostlink::settings {

/**
 * @brief Мастер-ключ и сертификат
 *
 * - security.master_key (default: "" - взять из devices.json или сгенерировать)
 * - security.cert_file  (default: "" - отпечаток не выдаётся)
 */
class SecuritySettings {
public:
    SecuritySettings() = default;

    explicit SecuritySettings(std::shared_ptr<IEnvironment> env)
        : masterKey_(env->get<std::string>("security.master_key", ""))
        , certFile_(env->get<std::string>("security.cert_file", ""))
    {
    }

    const std::string& getMasterKey() const { return masterKey_; }
    const std::string& getCertFile() const { return certFile_; }

    void setMasterKey(const std::string& key) { masterKey_ = key; }
    void setCertFile(const std::string& path) { certFile_ = path; }

private:
    std::string masterKey_;
    std::string certFile_;
};

} // namespace hostlink::settings
