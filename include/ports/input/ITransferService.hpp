#pragma once

#include "domain/ByteRange.hpp"
#include "domain/ClientIdentity.hpp"
#include "domain/TransferSession.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hostlink::ports::input {

struct UploadRequest {
    std::string destinationPath;
    std::string fileName;
    std::optional<std::uint64_t> fileSize;
    domain::ConflictPolicy conflictPolicy = domain::ConflictPolicy::ABORT;
};

struct UploadInitiateResult {
    std::string uploadId;
    std::string finalFileName;
    bool resumed = false;
};

struct ConflictCheckResult {
    bool conflict = false;
    std::string existingFile;
    std::string suggestedName;
};

struct ChunkWriteResult {
    bool accepted = true;          ///< false если чанк целиком ниже записанного смещения
    std::uint64_t bytesWritten = 0;
    std::uint64_t nextExpectedOffset = 0;
};

struct DirectUploadResult {
    std::string finalPath;
    std::string fileName;
    std::uint64_t bytesWritten = 0;
};

struct DownloadInitiateResult {
    std::string downloadId;
    std::uint64_t fileSize = 0;
    std::string fileName;
};

struct ChunkReadResult {
    std::string data;
    domain::ByteRange range;
    std::uint64_t fileSize = 0;
    std::string fileName;
};

/**
 * @brief Снимок сессии для /status и /list-active
 */
struct TransferSnapshot {
    domain::TransferSession session;
    std::uint64_t bufferedBytes = 0;  ///< для upload: байты, ждущие заполнения разрыва
};

/**
 * @brief Движок возобновляемых передач файлов
 *
 * Операции над существующей сессией доступны только её владельцу
 * (чужие сессии неотличимы от несуществующих: NotFoundError).
 * Мастер-ключ дополнительно видит любые сессии в status/list/cancel.
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    // ---- upload ----

    virtual UploadInitiateResult initiateUpload(const domain::ClientIdentity& caller,
                                                const UploadRequest& request) = 0;

    virtual ConflictCheckResult checkConflict(const std::string& destinationPath,
                                              const std::string& fileName) = 0;

    virtual ChunkWriteResult writeChunk(const domain::ClientIdentity& caller,
                                        const std::string& uploadId,
                                        std::uint64_t offset,
                                        const std::string& bytes) = 0;

    /**
     * @brief Дописать тело целиком с текущего смещения сессии
     *
     * Для клиентов без нарезки на чанки. Пустое тело ничего не меняет.
     */
    virtual ChunkWriteResult streamUpload(const domain::ClientIdentity& caller,
                                          const std::string& uploadId,
                                          const std::string& bytes) = 0;

    /**
     * @brief Загрузка одним запросом, без сессии
     *
     * Байты пишутся во временный файл и атомарно переносятся в итоговый путь.
     * Правила имён и конфликтов те же, что у initiateUpload.
     */
    virtual DirectUploadResult directUpload(const domain::ClientIdentity& caller,
                                            const UploadRequest& request,
                                            const std::string& bytes) = 0;

    /**
     * @return Итоговый путь файла
     */
    virtual std::string completeUpload(const domain::ClientIdentity& caller,
                                       const std::string& uploadId) = 0;

    virtual void cancelUpload(const domain::ClientIdentity& caller, const std::string& uploadId) = 0;

    virtual TransferSnapshot pauseUpload(const domain::ClientIdentity& caller, const std::string& uploadId) = 0;

    virtual TransferSnapshot resumeUpload(const domain::ClientIdentity& caller, const std::string& uploadId) = 0;

    // ---- download ----

    virtual DownloadInitiateResult initiateDownload(const domain::ClientIdentity& caller,
                                                    const std::string& filePath) = 0;

    virtual ChunkReadResult readChunk(const domain::ClientIdentity& caller,
                                      const std::string& downloadId,
                                      const std::optional<std::string>& rangeHeader) = 0;

    virtual TransferSnapshot pauseDownload(const domain::ClientIdentity& caller, const std::string& downloadId) = 0;

    virtual TransferSnapshot resumeDownload(const domain::ClientIdentity& caller, const std::string& downloadId) = 0;

    virtual void cancelDownload(const domain::ClientIdentity& caller, const std::string& downloadId) = 0;

    // ---- общие ----

    virtual TransferSnapshot status(const domain::ClientIdentity& caller,
                                    domain::TransferKind kind,
                                    const std::string& transferId) = 0;

    virtual std::vector<TransferSnapshot> listActive(const domain::ClientIdentity& caller,
                                                     domain::TransferKind kind) = 0;

    /**
     * @brief Восстановить таблицы сессий из дескрипторов на диске
     * @return Сколько сессий восстановлено
     */
    virtual std::size_t restoreSessions() = 0;

    /**
     * @brief Удалить сессии старше окна хранения
     * @return Сколько сессий удалено
     */
    virtual std::size_t sweepStale() = 0;
};

} // namespace hostlink::ports::input
