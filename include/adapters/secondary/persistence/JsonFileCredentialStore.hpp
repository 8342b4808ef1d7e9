#pragma once

#include "ports/output/ICredentialStore.hpp"
#include "settings/SecuritySettings.hpp"
#include "settings/StorageSettings.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hostlink::adapters::secondary {

/**
 * @brief Хранилище устройств в JSON-файле
 *
 * Формат файла:
 * {
 *   "master_key": "<uuid>",
 *   "devices": [ {"device_id": ..., "api_key": ..., "is_approved": ...}, ... ]
 * }
 *
 * Каждая мутация готовит новое состояние копией, записывает файл целиком
 * (tmp + rename) и только после успешной записи публикует его в памяти.
 * Поэтому ни в памяти, ни на диске не бывает "одобрен без ключа".
 *
 * Thread-safe: да (один mutex на всё хранилище)
 */
class JsonFileCredentialStore : public ports::output::ICredentialStore {
public:
    /**
     * @throws ValidationError если security.master_key задан, но не UUID
     * @throws InternalError если файл существует, но не читается
     */
    JsonFileCredentialStore(std::shared_ptr<settings::StorageSettings> storage,
                            std::shared_ptr<settings::SecuritySettings> security);

    std::optional<domain::Device> lookupByKey(const std::string& apiKey) override;
    std::optional<domain::Device> findById(const std::string& deviceId) override;
    domain::Device registerDevice(const domain::DeviceRegistration& registration) override;
    domain::Device approve(const std::string& deviceId) override;
    bool revoke(const std::string& deviceId) override;
    void touch(const std::string& deviceId, const std::string& ip) override;
    std::vector<domain::Device> listAll() override;
    std::string masterKey() override;

private:
    using DeviceMap = std::map<std::string, domain::Device>;

    void load();
    void commitLocked(DeviceMap next);
    void writeFile(const std::string& masterKey, const DeviceMap& devices) const;

    static nlohmann::json toJson(const domain::Device& device);
    static domain::Device fromJson(const nlohmann::json& j);

    std::string path_;
    std::mutex mutex_;
    std::string masterKey_;
    DeviceMap devices_;
    std::unordered_map<std::string, std::string> keyIndex_;  ///< api_key -> device_id
};

} // namespace hostlink::adapters::secondary
