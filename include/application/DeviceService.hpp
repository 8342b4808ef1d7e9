#pragma once

#include "domain/Errors.hpp"
#include "domain/Timestamp.hpp"
#include "ports/input/IDeviceService.hpp"
#include "ports/output/ICredentialStore.hpp"
#include "ports/output/IEventBroadcaster.hpp"
#include "utils/LogSanitizer.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <mutex>

namespace hostlink::application {

/**
 * @brief Управление сопряжёнными устройствами
 */
class DeviceService : public ports::input::IDeviceService {
public:
    DeviceService(std::shared_ptr<ports::output::ICredentialStore> store,
                  std::shared_ptr<ports::output::IEventBroadcaster> broadcaster)
        : store_(std::move(store))
        , broadcaster_(std::move(broadcaster))
    {
        std::cout << "[DeviceService] Created" << std::endl;
    }

    std::vector<domain::Device> listDevices() override
    {
        return store_->listAll();
    }

    void revokeDevice(const std::string& deviceId) override
    {
        auto device = store_->findById(deviceId);
        if (!device || !store_->revoke(deviceId)) {
            throw domain::NotFoundError("Device not found");
        }
        broadcaster_->broadcast(domain::ServerEvent::notification(
            "Device revoked", device->deviceName + " can no longer connect",
            domain::Timestamp::now().toString()));
    }

    domain::Device reconnect(const domain::ClientIdentity& caller,
                             const std::string& deviceId,
                             const std::optional<std::string>& fingerprint,
                             const std::string& ip) override
    {
        auto device = requireOwnDevice(caller, deviceId);

        if (fingerprint && !fingerprint->empty() && !device.fingerprint.empty() &&
            *fingerprint != device.fingerprint) {
            std::cerr << "[DeviceService] Fingerprint mismatch on reconnect of " << deviceId << std::endl;
            throw domain::AuthError("Device fingerprint mismatch");
        }

        store_->touch(deviceId, ip);
        std::cout << "[DeviceService] Device " << deviceId << " reconnected from "
                  << utils::sanitizeForLog(ip, 64) << std::endl;
        return store_->findById(deviceId).value_or(device);
    }

    domain::Device changeIp(const domain::ClientIdentity& caller,
                            const std::string& deviceId,
                            const std::string& newIp) override
    {
        if (newIp.empty()) {
            throw domain::ValidationError("new_ip is required");
        }
        auto device = requireOwnDevice(caller, deviceId);
        store_->touch(deviceId, newIp);
        return store_->findById(deviceId).value_or(device);
    }

    std::vector<domain::IpChange> ipHistory(const std::string& deviceId, int limit) override
    {
        if (limit < 1 || limit > static_cast<int>(domain::Device::MAX_IP_HISTORY)) {
            throw domain::ValidationError("limit must be between 1 and 100");
        }
        auto device = store_->findById(deviceId);
        if (!device) {
            throw domain::NotFoundError("Device not found");
        }

        std::vector<domain::IpChange> result;
        for (auto it = device->ipHistory.rbegin();
             it != device->ipHistory.rend() && static_cast<int>(result.size()) < limit; ++it) {
            result.push_back(*it);
        }
        return result;
    }

    ports::input::AnnounceResult announce(const domain::ClientIdentity& caller,
                                          const std::string& name,
                                          const std::string& ip) override
    {
        if (name.empty()) {
            throw domain::ValidationError("name is required");
        }
        if (!caller.isMaster) {
            store_->touch(caller.deviceId, ip);
        }

        ports::input::AnnounceResult result{name, ip, false};
        {
            std::lock_guard<std::mutex> lock(announceMutex_);
            result.firstSeen = announced_.emplace(ip, domain::Timestamp::now()).second;
            if (!result.firstSeen) {
                announced_[ip] = domain::Timestamp::now();
            }
        }

        if (result.firstSeen) {
            std::cout << "[DeviceService] New device announced: " << utils::sanitizeForLog(name, 64)
                      << " (" << utils::sanitizeForLog(ip, 64) << ")" << std::endl;
            broadcaster_->broadcast(domain::ServerEvent::notification(
                "Device Connected", name + " (" + ip + ") has connected.",
                domain::Timestamp::now().toString()));
        }
        return result;
    }

private:
    std::shared_ptr<ports::output::ICredentialStore> store_;
    std::shared_ptr<ports::output::IEventBroadcaster> broadcaster_;

    std::mutex announceMutex_;
    std::map<std::string, domain::Timestamp> announced_;  ///< ip -> последнее объявление

    /**
     * @brief Ключ вызывающего должен принадлежать одобренному устройству deviceId
     */
    domain::Device requireOwnDevice(const domain::ClientIdentity& caller, const std::string& deviceId)
    {
        if (caller.isMaster || caller.deviceId != deviceId) {
            throw domain::NotFoundError("Device not found or not approved");
        }
        auto device = store_->findById(deviceId);
        if (!device || !device->isApproved) {
            throw domain::NotFoundError("Device not found or not approved");
        }
        return *device;
    }
};

} // namespace hostlink::application
