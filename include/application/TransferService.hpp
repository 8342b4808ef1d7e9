#pragma once

#include "domain/Errors.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/IPathValidator.hpp"
#include "ports/output/ITaskExecutor.hpp"
#include "ports/output/ITransferStorage.hpp"
#include "settings/TransferSettings.hpp"

#include <ThreadSafeMap.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hostlink::application {

/**
 * @brief Движок возобновляемых передач файлов
 *
 * Upload: чанки могут приходить в любом порядке. Чанк по ожидаемому
 * смещению дописывается в .part, чанки впереди буферизуются в памяти,
 * после каждой записи сливается самый длинный непрерывный отрезок.
 * В .part никогда не попадает разрыв.
 *
 * Download: перед каждой выдачей чанка источник перечитывается через
 * stat(), изменение размера или mtime ломает сессию (ConflictError).
 *
 * Все операции над одной upload-сессией сериализуются её мьютексом,
 * разные сессии работают параллельно. Файловые вызовы идут через
 * ITaskExecutor.
 */
class TransferService : public ports::input::ITransferService {
public:
    TransferService(std::shared_ptr<ports::output::ITransferStorage> storage,
                    std::shared_ptr<ports::output::IPathValidator> validator,
                    std::shared_ptr<ports::output::ITaskExecutor> executor,
                    std::shared_ptr<settings::TransferSettings> settings);

    // ---- upload ----

    ports::input::UploadInitiateResult initiateUpload(const domain::ClientIdentity& caller,
                                                      const ports::input::UploadRequest& request) override;

    ports::input::ConflictCheckResult checkConflict(const std::string& destinationPath,
                                                    const std::string& fileName) override;

    ports::input::ChunkWriteResult writeChunk(const domain::ClientIdentity& caller,
                                              const std::string& uploadId,
                                              std::uint64_t offset,
                                              const std::string& bytes) override;

    ports::input::ChunkWriteResult streamUpload(const domain::ClientIdentity& caller,
                                                const std::string& uploadId,
                                                const std::string& bytes) override;

    ports::input::DirectUploadResult directUpload(const domain::ClientIdentity& caller,
                                                  const ports::input::UploadRequest& request,
                                                  const std::string& bytes) override;

    std::string completeUpload(const domain::ClientIdentity& caller, const std::string& uploadId) override;

    void cancelUpload(const domain::ClientIdentity& caller, const std::string& uploadId) override;

    ports::input::TransferSnapshot pauseUpload(const domain::ClientIdentity& caller,
                                               const std::string& uploadId) override;

    ports::input::TransferSnapshot resumeUpload(const domain::ClientIdentity& caller,
                                                const std::string& uploadId) override;

    // ---- download ----

    ports::input::DownloadInitiateResult initiateDownload(const domain::ClientIdentity& caller,
                                                          const std::string& filePath) override;

    ports::input::ChunkReadResult readChunk(const domain::ClientIdentity& caller,
                                            const std::string& downloadId,
                                            const std::optional<std::string>& rangeHeader) override;

    ports::input::TransferSnapshot pauseDownload(const domain::ClientIdentity& caller,
                                                 const std::string& downloadId) override;

    ports::input::TransferSnapshot resumeDownload(const domain::ClientIdentity& caller,
                                                  const std::string& downloadId) override;

    void cancelDownload(const domain::ClientIdentity& caller, const std::string& downloadId) override;

    // ---- общие ----

    ports::input::TransferSnapshot status(const domain::ClientIdentity& caller,
                                          domain::TransferKind kind,
                                          const std::string& transferId) override;

    std::vector<ports::input::TransferSnapshot> listActive(const domain::ClientIdentity& caller,
                                                           domain::TransferKind kind) override;

    std::size_t restoreSessions() override;

    std::size_t sweepStale() override;

private:
    /**
     * @brief Состояние сессии в памяти
     *
     * pending - чанки впереди записанного смещения (только upload).
     * closed выставляется при завершении/отмене: поток, который успел
     * взять shared_ptr до erase, увидит его под мьютексом.
     */
    struct SessionState {
        std::mutex mutex;
        domain::TransferSession session;
        std::map<std::uint64_t, std::string> pending;
        std::uint64_t pendingBytes = 0;
        bool closed = false;
    };

    using SessionTable = ThreadSafeMap<std::string, SessionState>;

    std::shared_ptr<ports::output::ITransferStorage> storage_;
    std::shared_ptr<ports::output::IPathValidator> validator_;
    std::shared_ptr<ports::output::ITaskExecutor> executor_;
    std::shared_ptr<settings::TransferSettings> settings_;

    SessionTable uploads_;
    SessionTable downloads_;

    /// Выбор итогового имени и создание сессии (или перенос direct-файла) атомарны
    std::mutex initiateMutex_;

    SessionTable& table(domain::TransferKind kind);

    /**
     * @brief Найти сессию, доступную вызывающему
     * @throws NotFoundError если сессии нет или она чужая
     */
    std::shared_ptr<SessionState> require(const domain::ClientIdentity& caller,
                                          domain::TransferKind kind,
                                          const std::string& transferId,
                                          bool allowAdmin);

    /**
     * @brief Записать байты с offset: буферизация впереди и слияние. Вызывается под state.mutex
     */
    ports::input::ChunkWriteResult writeLocked(SessionState& state,
                                               const std::string& uploadId,
                                               std::uint64_t offset,
                                               const std::string& bytes);

    /**
     * @brief Итоговое имя в directory по политике конфликта. Вызывается под initiateMutex_
     * @throws ConflictError для ABORT или если на месте файла каталог
     */
    std::string resolveFinalName(const std::string& directory,
                                 const std::string& fileName,
                                 domain::ConflictPolicy policy);

    /**
     * @brief Закрыть сессию и удалить её файлы. Вызывается под state.mutex
     */
    void closeLocked(SessionState& state, domain::TransferStatus finalStatus);

    ports::input::TransferSnapshot setStatus(const domain::ClientIdentity& caller,
                                             domain::TransferKind kind,
                                             const std::string& transferId,
                                             domain::TransferStatus status);

    void cancel(const domain::ClientIdentity& caller, domain::TransferKind kind, const std::string& transferId);

    std::string uniqueName(const std::string& directory, const std::string& fileName);

    std::optional<ports::output::FileStat> statPath(const std::string& path);

    static ports::input::TransferSnapshot snapshotLocked(const SessionState& state);
};

} // namespace hostlink::application
