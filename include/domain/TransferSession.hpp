#pragma once

#include "enums/ConflictPolicy.hpp"
#include "enums/TransferKind.hpp"
#include "enums/TransferStatus.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace hostlink::domain {

/**
 * @brief Поля, специфичные для загрузки на хост
 */
struct UploadDetails {
    std::string finalPath;                     ///< куда переносится .part при complete
    ConflictPolicy conflictPolicy = ConflictPolicy::ABORT;
    std::optional<std::uint64_t> expectedSize; ///< объявленный клиентом размер
};

/**
 * @brief Поля, специфичные для скачивания с хоста
 */
struct DownloadDetails {
    std::string sourcePath;
    std::uint64_t fileSize = 0;
    int64_t sourceModifiedAt = 0;  ///< mtime источника в момент initiate (нс)
};

/**
 * @brief Сессия передачи файла (upload или download)
 *
 * Владелец (clientId) сверяется на каждой операции.
 */
struct TransferSession {
    std::string transferId;
    std::string clientId;
    std::string fileName;
    std::uint64_t bytesTransferred = 0;
    TransferStatus status = TransferStatus::ACTIVE;
    Timestamp createdAt;
    std::variant<UploadDetails, DownloadDetails> details;

    TransferKind kind() const {
        return std::holds_alternative<UploadDetails>(details)
            ? TransferKind::UPLOAD
            : TransferKind::DOWNLOAD;
    }

    const UploadDetails& upload() const { return std::get<UploadDetails>(details); }
    UploadDetails& upload() { return std::get<UploadDetails>(details); }

    const DownloadDetails& download() const { return std::get<DownloadDetails>(details); }
    DownloadDetails& download() { return std::get<DownloadDetails>(details); }

    /**
     * @brief Разрешён ли доступ вызывающему клиенту
     *
     * Мастер-ключ имеет доступ только к административным операциям,
     * это решает вызывающая сторона через allowAdmin.
     */
    bool isAccessibleBy(const std::string& callerId, bool allowAdmin) const {
        return clientId == callerId || allowAdmin;
    }
};

} // namespace hostlink::domain
