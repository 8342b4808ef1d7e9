#pragma once

#include "ports/output/ITransferStorage.hpp"
#include "settings/StorageSettings.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>

namespace hostlink::adapters::secondary {

/**
 * @brief Сессии передачи на диске
 *
 * <upload_dir>/{id}.meta + {id}.part, <download_dir>/{id}.meta.
 * Дескрипторы пишутся через tmp + rename.
 */
class FileTransferStorage : public ports::output::ITransferStorage {
public:
    explicit FileTransferStorage(std::shared_ptr<settings::StorageSettings> settings);

    void saveSession(const domain::TransferSession& session) override;
    std::vector<domain::TransferSession> loadSessions(domain::TransferKind kind) override;
    void removeSession(domain::TransferKind kind, const std::string& transferId) override;
    std::size_t sweepOrphans(domain::TransferKind kind,
                             std::chrono::seconds maxAge,
                             const std::set<std::string>& liveIds) override;

    void createPart(const std::string& transferId) override;
    std::optional<std::uint64_t> partSize(const std::string& transferId) override;
    void appendPart(const std::string& transferId, const std::string& bytes) override;
    void commitPart(const std::string& transferId, const std::string& finalPath) override;

    std::optional<ports::output::FileStat> stat(const std::string& path) override;
    std::string readRange(const std::string& path, std::uint64_t offset, std::uint64_t length) override;

    static nlohmann::json toJson(const domain::TransferSession& session);
    static domain::TransferSession fromJson(domain::TransferKind kind, const nlohmann::json& j);

private:
    std::filesystem::path dirFor(domain::TransferKind kind) const;
    std::filesystem::path metaPath(domain::TransferKind kind, const std::string& id) const;
    std::filesystem::path partPath(const std::string& id) const;

    std::filesystem::path uploadDir_;
    std::filesystem::path downloadDir_;
};

} // namespace hostlink::adapters::secondary
