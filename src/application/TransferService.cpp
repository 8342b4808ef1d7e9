#include "application/TransferService.hpp"

#include "utils/LogSanitizer.hpp"
#include "utils/UuidGenerator.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace hostlink::application {

using domain::TransferKind;
using domain::TransferStatus;
using ports::input::TransferSnapshot;

TransferService::TransferService(std::shared_ptr<ports::output::ITransferStorage> storage,
                                 std::shared_ptr<ports::output::IPathValidator> validator,
                                 std::shared_ptr<ports::output::ITaskExecutor> executor,
                                 std::shared_ptr<settings::TransferSettings> settings)
    : storage_(std::move(storage))
    , validator_(std::move(validator))
    , executor_(std::move(executor))
    , settings_(std::move(settings))
{
    std::cout << "[TransferService] Created, retention "
              << settings_->getRetention().count() << " s" << std::endl;
}

// ============================================================================
// Upload
// ============================================================================

ports::input::UploadInitiateResult TransferService::initiateUpload(
    const domain::ClientIdentity& caller,
    const ports::input::UploadRequest& request)
{
    std::string directory = validator_->resolve(request.destinationPath);
    std::string fileName = validator_->validateFileName(request.fileName);

    std::lock_guard<std::mutex> initLock(initiateMutex_);

    auto dirStat = statPath(directory);
    if (!dirStat || !dirStat->isDirectory) {
        throw domain::ValidationError("Destination is not a directory");
    }

    std::string finalName = resolveFinalName(directory, fileName, request.conflictPolicy);
    std::string finalPath = (fs::path(directory) / finalName).string();

    // Повторный initiate того же клиента в тот же путь возвращает открытую сессию
    for (const auto& state : uploads_.values()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        const auto& session = state->session;
        if (!state->closed && session.clientId == caller.clientId &&
            session.upload().finalPath == finalPath && domain::isOpenStatus(session.status)) {
            std::cout << "[TransferService] Resuming upload " << session.transferId
                      << " at offset " << session.bytesTransferred << std::endl;
            return {session.transferId, session.fileName, true};
        }
    }

    auto state = std::make_shared<SessionState>();
    auto& session = state->session;
    session.transferId = utils::UuidGenerator::generate();
    session.clientId = caller.clientId;
    session.fileName = finalName;
    session.status = TransferStatus::ACTIVE;
    session.createdAt = domain::Timestamp::now();
    session.details = domain::UploadDetails{finalPath, request.conflictPolicy, request.fileSize};

    executor_->run([this, &session]() {
        storage_->createPart(session.transferId);
        storage_->saveSession(session);
    });
    uploads_.insert(session.transferId, state);

    std::cout << "[TransferService] Upload " << session.transferId << " initiated: "
              << utils::sanitizeForLog(finalPath) << std::endl;
    return {session.transferId, finalName, false};
}

ports::input::ConflictCheckResult TransferService::checkConflict(const std::string& destinationPath,
                                                                 const std::string& fileName)
{
    std::string directory = validator_->resolve(destinationPath);
    std::string name = validator_->validateFileName(fileName);

    auto dirStat = statPath(directory);
    if (!dirStat || !dirStat->isDirectory) {
        throw domain::ValidationError("Destination is not a directory");
    }

    ports::input::ConflictCheckResult result;
    if (statPath((fs::path(directory) / name).string())) {
        result.conflict = true;
        result.existingFile = name;
        result.suggestedName = uniqueName(directory, name);
    }
    return result;
}

ports::input::ChunkWriteResult TransferService::writeChunk(const domain::ClientIdentity& caller,
                                                           const std::string& uploadId,
                                                           std::uint64_t offset,
                                                           const std::string& bytes)
{
    auto state = require(caller, TransferKind::UPLOAD, uploadId, false);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        throw domain::NotFoundError("Upload session not found");
    }

    if (bytes.empty()) {
        throw domain::ValidationError("Chunk body is empty");
    }
    return writeLocked(*state, uploadId, offset, bytes);
}

ports::input::ChunkWriteResult TransferService::streamUpload(const domain::ClientIdentity& caller,
                                                             const std::string& uploadId,
                                                             const std::string& bytes)
{
    auto state = require(caller, TransferKind::UPLOAD, uploadId, false);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        throw domain::NotFoundError("Upload session not found");
    }
    const std::uint64_t offset = state->session.bytesTransferred;
    if (bytes.empty()) {
        return {true, 0, offset};
    }

    auto result = writeLocked(*state, uploadId, offset, bytes);
    std::cout << "[TransferService] Streamed " << bytes.size() << " bytes into upload " << uploadId
              << ", next offset " << result.nextExpectedOffset << std::endl;
    return result;
}

ports::input::DirectUploadResult TransferService::directUpload(const domain::ClientIdentity& caller,
                                                               const ports::input::UploadRequest& request,
                                                               const std::string& bytes)
{
    std::string directory = validator_->resolve(request.destinationPath);
    std::string fileName = validator_->validateFileName(request.fileName);
    if (request.fileSize && *request.fileSize != bytes.size()) {
        throw domain::ValidationError("Size mismatch: expected " + std::to_string(*request.fileSize) +
                                      " bytes, received " + std::to_string(bytes.size()));
    }

    auto dirStat = statPath(directory);
    if (!dirStat || !dirStat->isDirectory) {
        throw domain::ValidationError("Destination is not a directory");
    }

    // временный .part без дескриптора: если процесс упадёт, его подберёт sweepOrphans
    const std::string tempId = utils::UuidGenerator::generate();
    auto discardTemp = [this, &tempId]() {
        try {
            executor_->run([this, &tempId]() { storage_->removeSession(TransferKind::UPLOAD, tempId); });
        } catch (const domain::HostLinkError& e) {
            std::cerr << "[TransferService] Failed to remove direct upload " << tempId << ": " << e.what() << std::endl;
        }
    };

    try {
        executor_->run([this, &tempId, &bytes]() {
            storage_->createPart(tempId);
            if (!bytes.empty()) {
                storage_->appendPart(tempId, bytes);
            }
        });
    } catch (const domain::HostLinkError&) {
        discardTemp();
        throw;
    }

    std::string finalPath;
    std::string finalName;
    try {
        std::lock_guard<std::mutex> initLock(initiateMutex_);
        finalName = resolveFinalName(directory, fileName, request.conflictPolicy);
        finalPath = (fs::path(directory) / finalName).string();
        executor_->run([this, &tempId, &finalPath]() {
            storage_->commitPart(tempId, finalPath);
        });
    } catch (const domain::HostLinkError&) {
        discardTemp();
        throw;
    }

    std::cout << "[TransferService] Direct upload by " << caller.clientId.substr(0, 8) << ": "
              << utils::sanitizeForLog(finalPath) << " (" << bytes.size() << " bytes)" << std::endl;
    return {finalPath, finalName, bytes.size()};
}

ports::input::ChunkWriteResult TransferService::writeLocked(SessionState& state,
                                                            const std::string& uploadId,
                                                            std::uint64_t offset,
                                                            const std::string& bytes)
{
    auto& session = state.session;
    const std::uint64_t expected = session.bytesTransferred;
    const std::uint64_t end = offset + bytes.size();

    const auto& declared = session.upload().expectedSize;
    if (declared && end > *declared) {
        throw domain::ValidationError("Chunk exceeds the declared file size");
    }

    if (end <= expected) {
        return {false, 0, expected};
    }

    // Частичное перекрытие с уже записанным: берём только хвост
    std::uint64_t start = std::max(offset, expected);
    std::string data = bytes.substr(start - offset);

    if (start > expected) {
        auto it = state.pending.find(start);
        std::uint64_t replaced = (it != state.pending.end()) ? it->second.size() : 0;
        if (data.size() <= replaced) {
            return {true, bytes.size(), expected};
        }
        if (state.pendingBytes - replaced + data.size() > settings_->getMaxBufferedBytes()) {
            throw domain::ValidationError("Too much data buffered ahead of offset " + std::to_string(expected));
        }
        state.pendingBytes = state.pendingBytes - replaced + data.size();
        state.pending[start] = std::move(data);
        return {true, bytes.size(), expected};
    }

    // Чанк продолжает файл: добираем всё, что стало непрерывным
    std::uint64_t next = expected + data.size();
    while (!state.pending.empty()) {
        auto it = state.pending.begin();
        if (it->first > next) {
            break;
        }
        std::uint64_t chunkEnd = it->first + it->second.size();
        if (chunkEnd > next) {
            data.append(it->second, next - it->first, std::string::npos);
            next = chunkEnd;
        }
        state.pendingBytes -= it->second.size();
        state.pending.erase(it);
    }

    try {
        executor_->run([this, &uploadId, &data]() {
            storage_->appendPart(uploadId, data);
        });
    } catch (const domain::HostLinkError& e) {
        std::cerr << "[TransferService] Write failed for upload " << uploadId
                  << ", session aborted: " << e.what() << std::endl;
        closeLocked(state, TransferStatus::CANCELLED);
        uploads_.erase(uploadId);
        throw;
    }

    session.bytesTransferred = next;
    return {true, bytes.size(), next};
}

std::string TransferService::completeUpload(const domain::ClientIdentity& caller, const std::string& uploadId)
{
    auto state = require(caller, TransferKind::UPLOAD, uploadId, false);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        throw domain::NotFoundError("Upload session not found");
    }

    auto& session = state->session;
    const auto& upload = session.upload();
    if (!state->pending.empty()) {
        throw domain::ValidationError("Upload has a gap at offset " + std::to_string(session.bytesTransferred));
    }
    if (upload.expectedSize && *upload.expectedSize != session.bytesTransferred) {
        throw domain::ValidationError("Size mismatch: expected " + std::to_string(*upload.expectedSize) +
                                      " bytes, received " + std::to_string(session.bytesTransferred));
    }
    if (upload.conflictPolicy != domain::ConflictPolicy::OVERWRITE && statPath(upload.finalPath)) {
        throw domain::ConflictError("File '" + session.fileName + "' appeared during the upload",
                                    uniqueName(fs::path(upload.finalPath).parent_path().string(), session.fileName));
    }

    executor_->run([this, &session]() {
        storage_->commitPart(session.transferId, session.upload().finalPath);
    });
    closeLocked(*state, TransferStatus::COMPLETED);
    uploads_.erase(uploadId);

    std::cout << "[TransferService] Upload " << uploadId << " completed: "
              << utils::sanitizeForLog(upload.finalPath) << std::endl;
    return upload.finalPath;
}

void TransferService::cancelUpload(const domain::ClientIdentity& caller, const std::string& uploadId)
{
    cancel(caller, TransferKind::UPLOAD, uploadId);
}

TransferSnapshot TransferService::pauseUpload(const domain::ClientIdentity& caller, const std::string& uploadId)
{
    return setStatus(caller, TransferKind::UPLOAD, uploadId, TransferStatus::PAUSED);
}

TransferSnapshot TransferService::resumeUpload(const domain::ClientIdentity& caller, const std::string& uploadId)
{
    return setStatus(caller, TransferKind::UPLOAD, uploadId, TransferStatus::ACTIVE);
}

// ============================================================================
// Download
// ============================================================================

ports::input::DownloadInitiateResult TransferService::initiateDownload(const domain::ClientIdentity& caller,
                                                                       const std::string& filePath)
{
    std::string path = validator_->resolve(filePath);

    auto source = statPath(path);
    if (!source) {
        throw domain::NotFoundError("File not found");
    }
    if (!source->isRegularFile) {
        throw domain::ValidationError("Path is not a regular file");
    }

    auto state = std::make_shared<SessionState>();
    auto& session = state->session;
    session.transferId = utils::UuidGenerator::generate();
    session.clientId = caller.clientId;
    session.fileName = fs::path(path).filename().string();
    session.status = TransferStatus::ACTIVE;
    session.createdAt = domain::Timestamp::now();
    session.details = domain::DownloadDetails{path, source->size, source->modifiedAt};

    executor_->run([this, &session]() {
        storage_->saveSession(session);
    });
    downloads_.insert(session.transferId, state);

    std::cout << "[TransferService] Download " << session.transferId << " initiated: "
              << utils::sanitizeForLog(path) << " (" << source->size << " bytes)" << std::endl;
    return {session.transferId, source->size, session.fileName};
}

ports::input::ChunkReadResult TransferService::readChunk(const domain::ClientIdentity& caller,
                                                         const std::string& downloadId,
                                                         const std::optional<std::string>& rangeHeader)
{
    auto state = require(caller, TransferKind::DOWNLOAD, downloadId, false);

    domain::DownloadDetails details;
    std::string fileName;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->closed) {
            throw domain::NotFoundError("Download session not found");
        }
        details = state->session.download();
        fileName = state->session.fileName;
    }

    auto failSession = [&](const std::string& reason) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->closed) {
            std::cerr << "[TransferService] Download " << downloadId << " failed: " << reason << std::endl;
            closeLocked(*state, TransferStatus::CANCELLED);
            downloads_.erase(downloadId);
        }
    };

    auto current = statPath(details.sourcePath);
    if (!current) {
        failSession("source file removed");
        throw domain::NotFoundError("Source file no longer exists");
    }
    if (current->size != details.fileSize || current->modifiedAt != details.sourceModifiedAt) {
        failSession("source file changed");
        throw domain::ConflictError("File was modified since the download started");
    }

    ports::input::ChunkReadResult result;
    result.fileSize = details.fileSize;
    result.fileName = fileName;
    if (details.fileSize == 0 && (!rangeHeader || rangeHeader->empty())) {
        return result;
    }

    result.range = domain::ByteRange::parse(rangeHeader, details.fileSize);
    // за один ответ не больше download_chunk_size, клиент догружает остаток следующим Range
    const std::uint64_t chunkSize = settings_->getDownloadChunkSize();
    if (result.range.length() > chunkSize) {
        result.range.end = result.range.start + chunkSize;
    }
    result.data = executor_->run([this, &details, &result]() {
        return storage_->readRange(details.sourcePath, result.range.start, result.range.length());
    });
    if (result.data.size() != result.range.length()) {
        failSession("short read");
        throw domain::ConflictError("File was modified since the download started");
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    auto& session = state->session;
    session.bytesTransferred = std::max(session.bytesTransferred, result.range.end);
    return result;
}

TransferSnapshot TransferService::pauseDownload(const domain::ClientIdentity& caller, const std::string& downloadId)
{
    return setStatus(caller, TransferKind::DOWNLOAD, downloadId, TransferStatus::PAUSED);
}

TransferSnapshot TransferService::resumeDownload(const domain::ClientIdentity& caller, const std::string& downloadId)
{
    return setStatus(caller, TransferKind::DOWNLOAD, downloadId, TransferStatus::ACTIVE);
}

void TransferService::cancelDownload(const domain::ClientIdentity& caller, const std::string& downloadId)
{
    cancel(caller, TransferKind::DOWNLOAD, downloadId);
}

// ============================================================================
// Общие операции
// ============================================================================

TransferSnapshot TransferService::status(const domain::ClientIdentity& caller,
                                         TransferKind kind,
                                         const std::string& transferId)
{
    auto state = require(caller, kind, transferId, caller.isMaster);
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        throw domain::NotFoundError("Transfer session not found");
    }
    return snapshotLocked(*state);
}

std::vector<TransferSnapshot> TransferService::listActive(const domain::ClientIdentity& caller, TransferKind kind)
{
    std::vector<TransferSnapshot> result;
    for (const auto& state : table(kind).values()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->closed || !state->session.isAccessibleBy(caller.clientId, caller.isMaster)) {
            continue;
        }
        result.push_back(snapshotLocked(*state));
    }
    std::sort(result.begin(), result.end(), [](const TransferSnapshot& a, const TransferSnapshot& b) {
        return a.session.createdAt < b.session.createdAt;
    });
    return result;
}

std::size_t TransferService::restoreSessions()
{
    std::size_t restored = 0;
    std::size_t dropped = 0;

    auto uploads = executor_->run([this]() { return storage_->loadSessions(TransferKind::UPLOAD); });
    for (auto& session : uploads) {
        auto partSize = executor_->run([this, &session]() { return storage_->partSize(session.transferId); });
        if (!partSize || !domain::isOpenStatus(session.status)) {
            executor_->run([this, &session]() { storage_->removeSession(TransferKind::UPLOAD, session.transferId); });
            ++dropped;
            continue;
        }
        // .part пишется только непрерывно, поэтому его размер и есть следующее смещение
        session.bytesTransferred = *partSize;
        auto state = std::make_shared<SessionState>();
        state->session = session;
        uploads_.insert(session.transferId, state);
        ++restored;
    }

    auto downloads = executor_->run([this]() { return storage_->loadSessions(TransferKind::DOWNLOAD); });
    for (auto& session : downloads) {
        const auto& details = session.download();
        auto source = statPath(details.sourcePath);
        if (!source || !domain::isOpenStatus(session.status) ||
            source->size != details.fileSize || source->modifiedAt != details.sourceModifiedAt) {
            executor_->run([this, &session]() { storage_->removeSession(TransferKind::DOWNLOAD, session.transferId); });
            ++dropped;
            continue;
        }
        auto state = std::make_shared<SessionState>();
        state->session = session;
        downloads_.insert(session.transferId, state);
        ++restored;
    }

    std::cout << "[TransferService] Restored " << restored << " sessions, dropped "
              << dropped << " stale descriptors" << std::endl;
    return restored;
}

std::size_t TransferService::sweepStale()
{
    const auto retention = settings_->getRetention();
    std::size_t removed = 0;

    for (TransferKind kind : {TransferKind::UPLOAD, TransferKind::DOWNLOAD}) {
        auto& sessions = table(kind);
        std::set<std::string> liveIds;

        for (const auto& state : sessions.values()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) {
                continue;
            }
            const auto& session = state->session;
            if (session.createdAt.secondsAgo() > retention.count()) {
                std::cout << "[TransferService] Sweeping stale " << domain::toString(kind)
                          << " " << session.transferId << std::endl;
                std::string transferId = session.transferId;
                closeLocked(*state, TransferStatus::CANCELLED);
                sessions.erase(transferId);
                ++removed;
            } else {
                liveIds.insert(session.transferId);
            }
        }

        removed += executor_->run([this, kind, retention, &liveIds]() {
            return storage_->sweepOrphans(kind, retention, liveIds);
        });
    }

    if (removed > 0) {
        std::cout << "[TransferService] Sweep removed " << removed << " sessions" << std::endl;
    }
    return removed;
}

// ============================================================================
// Внутреннее
// ============================================================================

TransferService::SessionTable& TransferService::table(TransferKind kind)
{
    return kind == TransferKind::UPLOAD ? uploads_ : downloads_;
}

std::shared_ptr<TransferService::SessionState> TransferService::require(const domain::ClientIdentity& caller,
                                                                        TransferKind kind,
                                                                        const std::string& transferId,
                                                                        bool allowAdmin)
{
    auto state = table(kind).find(transferId);
    if (!state) {
        throw domain::NotFoundError(kind == TransferKind::UPLOAD ? "Upload session not found"
                                                                 : "Download session not found");
    }
    // clientId не меняется после создания, читаем без мьютекса
    if (!state->session.isAccessibleBy(caller.clientId, allowAdmin)) {
        throw domain::NotFoundError(kind == TransferKind::UPLOAD ? "Upload session not found"
                                                                 : "Download session not found");
    }
    return state;
}

void TransferService::closeLocked(SessionState& state, TransferStatus finalStatus)
{
    state.closed = true;
    state.session.status = finalStatus;
    state.pending.clear();
    state.pendingBytes = 0;

    const auto kind = state.session.kind();
    const std::string transferId = state.session.transferId;
    try {
        executor_->run([this, kind, &transferId]() {
            storage_->removeSession(kind, transferId);
        });
    } catch (const domain::HostLinkError& e) {
        // файлы подберёт sweepOrphans
        std::cerr << "[TransferService] Failed to remove files of " << transferId << ": " << e.what() << std::endl;
    }
}

TransferSnapshot TransferService::setStatus(const domain::ClientIdentity& caller,
                                            TransferKind kind,
                                            const std::string& transferId,
                                            TransferStatus status)
{
    auto state = require(caller, kind, transferId, false);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        throw domain::NotFoundError("Transfer session not found");
    }
    auto& session = state->session;
    if (session.status != status) {
        session.status = status;
        executor_->run([this, &session]() {
            storage_->saveSession(session);
        });
        std::cout << "[TransferService] " << domain::toString(kind) << " " << transferId
                  << " -> " << domain::toString(status) << " at " << session.bytesTransferred << std::endl;
    }
    return snapshotLocked(*state);
}

void TransferService::cancel(const domain::ClientIdentity& caller, TransferKind kind, const std::string& transferId)
{
    auto state = table(kind).find(transferId);
    if (!state) {
        // повторная отмена не ошибка
        return;
    }
    if (!state->session.isAccessibleBy(caller.clientId, caller.isMaster)) {
        // чужая сессия отвечает так же, как несуществующая
        std::cerr << "[TransferService] Ignoring cancel of foreign " << domain::toString(kind)
                  << " " << transferId << " from " << caller.clientId << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed) {
        return;
    }
    closeLocked(*state, TransferStatus::CANCELLED);
    table(kind).erase(transferId);
    std::cout << "[TransferService] " << domain::toString(kind) << " " << transferId << " cancelled" << std::endl;
}

std::string TransferService::resolveFinalName(const std::string& directory,
                                              const std::string& fileName,
                                              domain::ConflictPolicy policy)
{
    auto existing = statPath((fs::path(directory) / fileName).string());
    if (!existing) {
        return fileName;
    }
    switch (policy) {
        case domain::ConflictPolicy::ABORT:
            throw domain::ConflictError("File '" + fileName + "' already exists",
                                        uniqueName(directory, fileName));
        case domain::ConflictPolicy::OVERWRITE:
            if (existing->isDirectory) {
                throw domain::ConflictError("A directory named '" + fileName + "' already exists");
            }
            return fileName;
        case domain::ConflictPolicy::KEEP_BOTH:
            return uniqueName(directory, fileName);
    }
    return fileName;
}

std::string TransferService::uniqueName(const std::string& directory, const std::string& fileName)
{
    fs::path name(fileName);
    std::string stem = name.stem().string();
    std::string extension = name.extension().string();

    for (int counter = 1; counter < 10000; ++counter) {
        std::string candidate = stem + " (" + std::to_string(counter) + ")" + extension;
        if (!statPath((fs::path(directory) / candidate).string())) {
            return candidate;
        }
    }
    throw domain::ConflictError("Could not find a free name for '" + fileName + "'");
}

std::optional<ports::output::FileStat> TransferService::statPath(const std::string& path)
{
    return executor_->run([this, &path]() {
        return storage_->stat(path);
    });
}

TransferSnapshot TransferService::snapshotLocked(const SessionState& state)
{
    return {state.session, state.pendingBytes};
}

} // namespace hostlink::application
