#include "adapters/secondary/persistence/FileTransferStorage.hpp"

#include "domain/Errors.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace hostlink::adapters::secondary {

namespace {

int64_t toNanos(fs::file_time_type time)
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

std::chrono::seconds ageOf(const fs::path& path)
{
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(fs::file_time_type::clock::now() - mtime);
}

} // namespace

FileTransferStorage::FileTransferStorage(std::shared_ptr<settings::StorageSettings> settings)
    : uploadDir_(settings->getUploadDir())
    , downloadDir_(settings->getDownloadDir())
{
    try {
        fs::create_directories(uploadDir_);
        fs::create_directories(downloadDir_);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[FileTransferStorage] Cannot create session dirs: " << e.what() << std::endl;
        throw domain::InternalError("Cannot create transfer session directories");
    }
    std::cout << "[FileTransferStorage] Created: uploads=" << uploadDir_
              << " downloads=" << downloadDir_ << std::endl;
}

// ============================================================================
// Дескрипторы
// ============================================================================

void FileTransferStorage::saveSession(const domain::TransferSession& session)
{
    fs::path target = metaPath(session.kind(), session.transferId);
    fs::path tmp = target;
    tmp += ".tmp";

    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
        throw domain::InternalError("Cannot write session descriptor");
    }
    out << toJson(session).dump();
    out.close();
    if (!out) {
        throw domain::InternalError("Cannot write session descriptor");
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::cerr << "[FileTransferStorage] rename " << tmp << ": " << ec.message() << std::endl;
        throw domain::InternalError("Cannot write session descriptor");
    }
}

std::vector<domain::TransferSession> FileTransferStorage::loadSessions(domain::TransferKind kind)
{
    std::vector<domain::TransferSession> result;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dirFor(kind), ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".meta") {
            continue;
        }
        try {
            std::ifstream in(entry.path());
            auto j = nlohmann::json::parse(in);
            auto session = fromJson(kind, j);
            session.transferId = entry.path().stem().string();
            result.push_back(std::move(session));
        } catch (const std::exception& e) {
            std::cerr << "[FileTransferStorage] Skipping unreadable descriptor "
                      << entry.path() << ": " << e.what() << std::endl;
        }
    }
    if (ec) {
        std::cerr << "[FileTransferStorage] Cannot list " << dirFor(kind) << ": " << ec.message() << std::endl;
    }
    return result;
}

void FileTransferStorage::removeSession(domain::TransferKind kind, const std::string& transferId)
{
    std::error_code ec;
    fs::remove(metaPath(kind, transferId), ec);
    if (kind == domain::TransferKind::UPLOAD) {
        fs::remove(partPath(transferId), ec);
    }
}

std::size_t FileTransferStorage::sweepOrphans(domain::TransferKind kind,
                                              std::chrono::seconds maxAge,
                                              const std::set<std::string>& liveIds)
{
    std::set<std::string> removed;
    std::vector<fs::path> victims;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dirFor(kind), ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto ext = entry.path().extension();
        if (ext != ".meta" && ext != ".part" && ext != ".tmp") {
            continue;
        }
        std::string id = entry.path().stem().string();
        if (liveIds.count(id) != 0) {
            continue;
        }
        if (ageOf(entry.path()) > maxAge) {
            victims.push_back(entry.path());
            removed.insert(id);
        }
    }

    for (const auto& path : victims) {
        std::error_code rmEc;
        fs::remove(path, rmEc);
        if (rmEc) {
            std::cerr << "[FileTransferStorage] Cannot remove " << path << ": " << rmEc.message() << std::endl;
        }
    }
    return removed.size();
}

// ============================================================================
// Частичные файлы
// ============================================================================

void FileTransferStorage::createPart(const std::string& transferId)
{
    std::ofstream out(partPath(transferId), std::ios::binary | std::ios::app);
    if (!out) {
        throw domain::InternalError("Cannot create partial file");
    }
}

std::optional<std::uint64_t> FileTransferStorage::partSize(const std::string& transferId)
{
    std::error_code ec;
    auto size = fs::file_size(partPath(transferId), ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

void FileTransferStorage::appendPart(const std::string& transferId, const std::string& bytes)
{
    std::ofstream out(partPath(transferId), std::ios::binary | std::ios::app);
    if (!out) {
        throw domain::InternalError("Cannot open partial file");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        throw domain::InternalError("Error writing file chunk");
    }
}

void FileTransferStorage::commitPart(const std::string& transferId, const std::string& finalPath)
{
    fs::path source = partPath(transferId);
    fs::path target(finalPath);

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    fs::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        // каталог назначения на другом разделе: копируем и удаляем
        ec.clear();
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            fs::remove(source, ec);
        }
    }
    if (ec) {
        std::cerr << "[FileTransferStorage] Cannot move " << source << " -> " << target
                  << ": " << ec.message() << std::endl;
        throw domain::InternalError("Error moving completed file");
    }
}

// ============================================================================
// Файлы хоста
// ============================================================================

std::optional<ports::output::FileStat> FileTransferStorage::stat(const std::string& path)
{
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::nullopt;
    }

    ports::output::FileStat result;
    result.isRegularFile = fs::is_regular_file(status);
    result.isDirectory = fs::is_directory(status);
    if (result.isRegularFile) {
        result.size = static_cast<std::uint64_t>(fs::file_size(path, ec));
        if (ec) {
            return std::nullopt;
        }
    }
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    result.modifiedAt = toNanos(mtime);
    return result;
}

std::string FileTransferStorage::readRange(const std::string& path, std::uint64_t offset, std::uint64_t length)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw domain::InternalError("Cannot open source file");
    }
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
        throw domain::InternalError("Cannot seek source file");
    }

    std::string data(length, '\0');
    in.read(data.data(), static_cast<std::streamsize>(length));
    data.resize(static_cast<std::size_t>(in.gcount()));
    return data;
}

// ============================================================================
// Формат .meta
// ============================================================================

nlohmann::json FileTransferStorage::toJson(const domain::TransferSession& session)
{
    nlohmann::json j;
    j["client_id"] = session.clientId;
    j["file_name"] = session.fileName;
    j["status"] = domain::toString(session.status);
    j["created_at"] = session.createdAt.toUnixSeconds();

    if (session.kind() == domain::TransferKind::UPLOAD) {
        const auto& up = session.upload();
        j["upload_id"] = session.transferId;
        j["final_path"] = up.finalPath;
        j["conflict_resolution"] = domain::toString(up.conflictPolicy);
        j["file_size"] = up.expectedSize ? nlohmann::json(*up.expectedSize) : nlohmann::json(nullptr);
        j["bytes_received"] = session.bytesTransferred;
    } else {
        const auto& down = session.download();
        j["download_id"] = session.transferId;
        j["file_path"] = down.sourcePath;
        j["file_size"] = down.fileSize;
        j["file_modified_at"] = down.sourceModifiedAt;
        j["bytes_downloaded"] = session.bytesTransferred;
    }
    return j;
}

domain::TransferSession FileTransferStorage::fromJson(domain::TransferKind kind, const nlohmann::json& j)
{
    domain::TransferSession session;
    session.clientId = j.at("client_id").get<std::string>();
    session.fileName = j.value("file_name", "");
    session.status = domain::transferStatusFromString(j.value("status", "active"));
    session.createdAt = domain::Timestamp::fromUnixSeconds(j.value("created_at", int64_t{0}));

    if (kind == domain::TransferKind::UPLOAD) {
        domain::UploadDetails up;
        up.finalPath = j.at("final_path").get<std::string>();
        up.conflictPolicy = domain::conflictPolicyFromString(j.value("conflict_resolution", "abort"));
        if (j.contains("file_size") && !j["file_size"].is_null()) {
            up.expectedSize = j["file_size"].get<std::uint64_t>();
        }
        session.transferId = j.value("upload_id", "");
        session.bytesTransferred = j.value("bytes_received", std::uint64_t{0});
        session.details = up;
    } else {
        domain::DownloadDetails down;
        down.sourcePath = j.at("file_path").get<std::string>();
        down.fileSize = j.at("file_size").get<std::uint64_t>();
        down.sourceModifiedAt = j.at("file_modified_at").get<int64_t>();
        session.transferId = j.value("download_id", "");
        session.bytesTransferred = j.value("bytes_downloaded", std::uint64_t{0});
        session.details = down;
    }
    return session;
}

// ============================================================================

fs::path FileTransferStorage::dirFor(domain::TransferKind kind) const
{
    return kind == domain::TransferKind::UPLOAD ? uploadDir_ : downloadDir_;
}

fs::path FileTransferStorage::metaPath(domain::TransferKind kind, const std::string& id) const
{
    return dirFor(kind) / (id + ".meta");
}

fs::path FileTransferStorage::partPath(const std::string& id) const
{
    return uploadDir_ / (id + ".part");
}

} // namespace hostlink::adapters::secondary
