#pragma once

#include "utils/Paths.hpp"
#include <IEnvironment.hpp>
#include <memory>
#include <string>

namespace hostlink::settings {

/**
 * @brief Где сервис хранит своё состояние
 *
 * Ключи в config.json:
 * - storage.data_dir         (default: ~/.hostlink)
 * - storage.upload_dir       (default: <data_dir>/uploads)
 * - storage.download_dir     (default: <data_dir>/downloads)
 * - storage.credentials_file (default: <data_dir>/devices.json)
 */
class StorageSettings {
public:
    StorageSettings() { useDataDir(utils::homeDirectory() + "/.hostlink"); }

    explicit StorageSettings(std::shared_ptr<IEnvironment> env)
    {
        useDataDir(env->get<std::string>("storage.data_dir", utils::homeDirectory() + "/.hostlink"));
        uploadDir_ = env->get<std::string>("storage.upload_dir", uploadDir_);
        downloadDir_ = env->get<std::string>("storage.download_dir", downloadDir_);
        credentialsFile_ = env->get<std::string>("storage.credentials_file", credentialsFile_);
    }

    const std::string& getDataDir() const { return dataDir_; }
    const std::string& getUploadDir() const { return uploadDir_; }
    const std::string& getDownloadDir() const { return downloadDir_; }
    const std::string& getCredentialsFile() const { return credentialsFile_; }

    /**
     * @brief Разместить всё состояние под одним каталогом (тесты используют tmp)
     */
    static StorageSettings forDataDir(const std::string& dataDir) {
        StorageSettings settings;
        settings.useDataDir(dataDir);
        return settings;
    }

private:
    void useDataDir(const std::string& dataDir) {
        dataDir_ = dataDir;
        uploadDir_ = dataDir + "/uploads";
        downloadDir_ = dataDir + "/downloads";
        credentialsFile_ = dataDir + "/devices.json";
    }

    std::string dataDir_;
    std::string uploadDir_;
    std::string downloadDir_;
    std::string credentialsFile_;
};

} // namespace hostlink::settings
