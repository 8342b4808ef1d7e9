#include "adapters/secondary/security/OpenSslCertificateInfo.hpp"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace hostlink::adapters::secondary {

OpenSslCertificateInfo::OpenSslCertificateInfo(std::shared_ptr<settings::SecuritySettings> settings)
    : certFile_(settings->getCertFile())
{
    std::cout << "[OpenSslCertificateInfo] Created: "
              << (certFile_.empty() ? "<no certificate>" : certFile_) << std::endl;
}

std::optional<std::string> OpenSslCertificateInfo::fingerprint()
{
    std::call_once(computed_, [this]() {
        if (certFile_.empty()) {
            std::cerr << "[OpenSslCertificateInfo] No certificate configured, fingerprint unavailable" << std::endl;
            return;
        }
        fingerprint_ = computeFingerprint(certFile_);
    });
    return fingerprint_;
}

std::optional<std::string> OpenSslCertificateInfo::computeFingerprint(const std::string& pemPath)
{
    FILE* fp = std::fopen(pemPath.c_str(), "r");
    if (!fp) {
        std::cerr << "[OpenSslCertificateInfo] Cannot open " << pemPath << std::endl;
        return std::nullopt;
    }
    X509* cert = PEM_read_X509(fp, nullptr, nullptr, nullptr);
    std::fclose(fp);
    if (!cert) {
        std::cerr << "[OpenSslCertificateInfo] Not a PEM certificate: " << pemPath << std::endl;
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    int ok = X509_digest(cert, EVP_sha256(), digest, &length);
    X509_free(cert);
    if (ok != 1) {
        std::cerr << "[OpenSslCertificateInfo] X509_digest failed for " << pemPath << std::endl;
        return std::nullopt;
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

} // namespace hostlink::adapters::secondary
