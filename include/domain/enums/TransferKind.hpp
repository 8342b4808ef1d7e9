#pragma once

#include <string>

namespace hostlink::domain {

enum class TransferKind {
    UPLOAD,
    DOWNLOAD
};

inline std::string toString(TransferKind kind) {
    return kind == TransferKind::UPLOAD ? "upload" : "download";
}

} // namespace hostlink::domain
