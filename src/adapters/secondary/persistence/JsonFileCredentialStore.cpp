#include "adapters/secondary/persistence/JsonFileCredentialStore.hpp"

#include "domain/Errors.hpp"
#include "utils/LogSanitizer.hpp"
#include "utils/UuidGenerator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace hostlink::adapters::secondary {

JsonFileCredentialStore::JsonFileCredentialStore(
    std::shared_ptr<settings::StorageSettings> storage,
    std::shared_ptr<settings::SecuritySettings> security)
    : path_(storage->getCredentialsFile())
{
    const std::string& configuredKey = security->getMasterKey();
    if (!configuredKey.empty() && !utils::UuidGenerator::isValid(configuredKey)) {
        throw domain::ValidationError("security.master_key must be a UUID");
    }

    load();

    std::lock_guard<std::mutex> lock(mutex_);
    std::string wanted = masterKey_;
    if (!configuredKey.empty()) {
        wanted = configuredKey;
    } else if (!utils::UuidGenerator::isValid(wanted)) {
        wanted = utils::UuidGenerator::generate();
        std::cout << "[JsonFileCredentialStore] Generated new master key" << std::endl;
    }
    if (wanted != masterKey_) {
        writeFile(wanted, devices_);
        masterKey_ = wanted;
    }

    std::cout << "[JsonFileCredentialStore] Created: " << path_
              << " (" << devices_.size() << " devices)" << std::endl;
}

std::optional<domain::Device> JsonFileCredentialStore::lookupByKey(const std::string& apiKey)
{
    if (!utils::UuidGenerator::isValid(apiKey)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keyIndex_.find(apiKey);
    if (it == keyIndex_.end()) {
        return std::nullopt;
    }
    return devices_.at(it->second);
}

std::optional<domain::Device> JsonFileCredentialStore::findById(const std::string& deviceId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

domain::Device JsonFileCredentialStore::registerDevice(const domain::DeviceRegistration& registration)
{
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceMap next = devices_;

    auto it = next.find(registration.deviceId);
    if (it == next.end()) {
        domain::Device device;
        device.deviceId = registration.deviceId;
        device.createdAt = domain::Timestamp::now();
        it = next.emplace(registration.deviceId, device).first;
    }

    domain::Device& device = it->second;
    device.deviceName = registration.deviceName;
    device.fingerprint = registration.fingerprint;
    device.platform = registration.platform;
    device.clientVersion = registration.clientVersion;
    device.recordIp(registration.ip);
    device.lastSeen = domain::Timestamp::now();

    domain::Device result = device;
    commitLocked(std::move(next));

    std::cout << "[JsonFileCredentialStore] Registered device "
              << utils::sanitizeForLog(result.deviceName) << " (" << result.deviceId << ")" << std::endl;
    return result;
}

domain::Device JsonFileCredentialStore::approve(const std::string& deviceId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceMap next = devices_;

    auto it = next.find(deviceId);
    if (it == next.end()) {
        throw domain::NotFoundError("Device not found");
    }

    std::string key;
    do {
        key = utils::UuidGenerator::generate();
    } while (keyIndex_.count(key) != 0 || key == masterKey_);

    it->second.apiKey = key;
    it->second.isApproved = true;
    it->second.lastSeen = domain::Timestamp::now();

    domain::Device result = it->second;
    commitLocked(std::move(next));

    std::cout << "[JsonFileCredentialStore] Approved device " << deviceId << std::endl;
    return result;
}

bool JsonFileCredentialStore::revoke(const std::string& deviceId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.find(deviceId) == devices_.end()) {
        return false;
    }
    DeviceMap next = devices_;
    next.erase(deviceId);
    commitLocked(std::move(next));

    std::cout << "[JsonFileCredentialStore] Revoked device " << deviceId << std::endl;
    return true;
}

void JsonFileCredentialStore::touch(const std::string& deviceId, const std::string& ip)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.find(deviceId) == devices_.end()) {
        return;
    }
    DeviceMap next = devices_;
    domain::Device& device = next.at(deviceId);
    const std::string previousIp = device.currentIp;
    if (device.recordIp(ip)) {
        std::cout << "[JsonFileCredentialStore] Device " << deviceId << " IP "
                  << previousIp << " -> " << utils::sanitizeForLog(ip) << std::endl;
    }
    device.lastSeen = domain::Timestamp::now();
    commitLocked(std::move(next));
}

std::vector<domain::Device> JsonFileCredentialStore::listAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<domain::Device> result;
    result.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        result.push_back(device);
    }
    return result;
}

std::string JsonFileCredentialStore::masterKey()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return masterKey_;
}

// ============================================================================
// Persistence
// ============================================================================

void JsonFileCredentialStore::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fs::exists(path_)) {
        std::cout << "[JsonFileCredentialStore] No credentials file yet: " << path_ << std::endl;
        return;
    }

    try {
        std::ifstream in(path_);
        auto root = nlohmann::json::parse(in);

        masterKey_ = root.value("master_key", "");
        for (const auto& item : root.value("devices", nlohmann::json::array())) {
            auto device = fromJson(item);
            // одобренное устройство без ключа - не доверяем такой записи
            if (device.isApproved && device.apiKey.empty()) {
                device.isApproved = false;
            }
            devices_[device.deviceId] = device;
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[JsonFileCredentialStore] Corrupt credentials file " << path_
                  << ": " << e.what() << std::endl;
        throw domain::InternalError("Cannot parse credentials file: " + path_);
    }

    keyIndex_.clear();
    for (const auto& [id, device] : devices_) {
        if (device.isApproved) {
            keyIndex_[device.apiKey] = id;
        }
    }
}

void JsonFileCredentialStore::commitLocked(DeviceMap next)
{
    writeFile(masterKey_, next);

    devices_ = std::move(next);
    keyIndex_.clear();
    for (const auto& [id, device] : devices_) {
        if (device.isApproved && !device.apiKey.empty()) {
            keyIndex_[device.apiKey] = id;
        }
    }
}

void JsonFileCredentialStore::writeFile(const std::string& masterKey, const DeviceMap& devices) const
{
    nlohmann::json root;
    root["master_key"] = masterKey;
    root["devices"] = nlohmann::json::array();
    for (const auto& [id, device] : devices) {
        root["devices"].push_back(toJson(device));
    }

    fs::path target(path_);
    fs::path tmp = target;
    tmp += ".tmp";

    try {
        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path());
        }
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                throw domain::InternalError("Cannot open " + tmp.string());
            }
            out << root.dump(2);
            out.flush();
            if (!out) {
                throw domain::InternalError("Cannot write " + tmp.string());
            }
        }
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write);
        fs::rename(tmp, target);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[JsonFileCredentialStore] Persist failed: " << e.what() << std::endl;
        throw domain::InternalError("Cannot persist credentials");
    }
}

nlohmann::json JsonFileCredentialStore::toJson(const domain::Device& device)
{
    nlohmann::json j;
    j["device_id"] = device.deviceId;
    j["device_name"] = device.deviceName;
    j["platform"] = device.platform;
    j["client_version"] = device.clientVersion;
    j["device_fingerprint"] = device.fingerprint;
    j["api_key"] = device.apiKey;
    j["is_approved"] = device.isApproved;
    j["current_ip"] = device.currentIp;
    j["last_seen"] = device.lastSeen.toUnixSeconds();
    j["created_at"] = device.createdAt.toUnixSeconds();
    j["ip_history"] = nlohmann::json::array();
    for (const auto& change : device.ipHistory) {
        j["ip_history"].push_back({
            {"old_ip", change.oldIp},
            {"new_ip", change.newIp},
            {"timestamp", change.at.toUnixSeconds()}
        });
    }
    return j;
}

domain::Device JsonFileCredentialStore::fromJson(const nlohmann::json& j)
{
    domain::Device device;
    device.deviceId = j.at("device_id").get<std::string>();
    device.deviceName = j.value("device_name", "");
    device.platform = j.value("platform", "");
    device.clientVersion = j.value("client_version", "");
    device.fingerprint = j.value("device_fingerprint", "");
    device.apiKey = j.value("api_key", "");
    device.isApproved = j.value("is_approved", false);
    device.currentIp = j.value("current_ip", "");
    device.lastSeen = domain::Timestamp::fromUnixSeconds(j.value("last_seen", int64_t{0}));
    device.createdAt = domain::Timestamp::fromUnixSeconds(j.value("created_at", int64_t{0}));
    for (const auto& change : j.value("ip_history", nlohmann::json::array())) {
        device.ipHistory.push_back(domain::IpChange{
            change.value("old_ip", ""),
            change.value("new_ip", ""),
            domain::Timestamp::fromUnixSeconds(change.value("timestamp", int64_t{0}))
        });
    }
    if (device.ipHistory.size() > domain::Device::MAX_IP_HISTORY) {
        device.ipHistory.erase(device.ipHistory.begin(),
                               device.ipHistory.end() - domain::Device::MAX_IP_HISTORY);
    }
    return device;
}

} // namespace hostlink::adapters::secondary
