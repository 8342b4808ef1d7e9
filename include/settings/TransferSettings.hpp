#pragma once

#include "utils/Paths.hpp"
#include <IEnvironment.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hostlink::settings {

/**
 * @brief Настройки движка передачи файлов
 *
 * Ключи в config.json:
 * - transfer.allowed_roots          (default: домашний каталог; список через запятую)
 * - transfer.retention_days         (default: 7)
 * - transfer.sweep_interval_seconds (default: 3600)
 * - transfer.upload_chunk_size      (default: 1 MiB)
 * - transfer.download_chunk_size    (default: 1 MiB)
 * - transfer.max_buffered_mb        (default: 64, на одну upload-сессию)
 * - transfer.io_threads             (default: 4)
 */
class TransferSettings {
public:
    TransferSettings() : allowedRoots_{utils::homeDirectory()} {}

    explicit TransferSettings(std::shared_ptr<IEnvironment> env)
        : allowedRoots_(utils::splitList(
              env->get<std::string>("transfer.allowed_roots", utils::homeDirectory())))
        , retention_(std::chrono::hours(24 * env->get<int>("transfer.retention_days", 7)))
        , sweepInterval_(std::chrono::seconds(env->get<int>("transfer.sweep_interval_seconds", 3600)))
        , uploadChunkSize_(static_cast<std::uint64_t>(env->get<int>("transfer.upload_chunk_size", 1024 * 1024)))
        , downloadChunkSize_(static_cast<std::uint64_t>(env->get<int>("transfer.download_chunk_size", 1024 * 1024)))
        , maxBufferedBytes_(static_cast<std::uint64_t>(env->get<int>("transfer.max_buffered_mb", 64)) * 1024 * 1024)
        , ioThreads_(env->get<int>("transfer.io_threads", 4))
    {
        if (allowedRoots_.empty()) {
            allowedRoots_.push_back(utils::homeDirectory());
        }
        if (ioThreads_ < 1) {
            ioThreads_ = 1;
        }
    }

    const std::vector<std::string>& getAllowedRoots() const { return allowedRoots_; }
    std::chrono::seconds getRetention() const { return retention_; }
    std::chrono::seconds getSweepInterval() const { return sweepInterval_; }
    std::uint64_t getUploadChunkSize() const { return uploadChunkSize_; }
    std::uint64_t getDownloadChunkSize() const { return downloadChunkSize_; }
    std::uint64_t getMaxBufferedBytes() const { return maxBufferedBytes_; }
    int getIoThreads() const { return ioThreads_; }

    void setAllowedRoots(std::vector<std::string> roots) { allowedRoots_ = std::move(roots); }
    void setRetention(std::chrono::seconds retention) { retention_ = retention; }
    void setMaxBufferedBytes(std::uint64_t bytes) { maxBufferedBytes_ = bytes; }
    void setDownloadChunkSize(std::uint64_t bytes) { downloadChunkSize_ = bytes; }

private:
    std::vector<std::string> allowedRoots_;
    std::chrono::seconds retention_{std::chrono::hours(24 * 7)};
    std::chrono::seconds sweepInterval_{3600};
    std::uint64_t uploadChunkSize_ = 1024 * 1024;
    std::uint64_t downloadChunkSize_ = 1024 * 1024;
    std::uint64_t maxBufferedBytes_ = 64ull * 1024 * 1024;
    int ioThreads_ = 4;
};

} // namespace hostlink::settings
