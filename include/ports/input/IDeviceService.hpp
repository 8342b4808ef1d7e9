#pragma once

#include "domain/ClientIdentity.hpp"
#include "domain/Device.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hostlink::ports::input {

/**
 * @brief Результат POST /announce
 */
struct AnnounceResult {
    std::string name;
    std::string ip;
    bool firstSeen = false;  ///< с этого адреса объявлений ещё не было
};

/**
 * @brief Администрирование устройств и повторное подключение
 */
class IDeviceService {
public:
    virtual ~IDeviceService() = default;

    virtual std::vector<domain::Device> listDevices() = 0;

    /**
     * @throws NotFoundError если устройства нет
     */
    virtual void revokeDevice(const std::string& deviceId) = 0;

    /**
     * @brief Тихое переподключение после смены IP
     *
     * @throws NotFoundError если вызывающий ключ не принадлежит одобренному
     *         устройству с таким device_id
     * @throws AuthError если fingerprint не совпадает
     */
    virtual domain::Device reconnect(const domain::ClientIdentity& caller,
                                     const std::string& deviceId,
                                     const std::optional<std::string>& fingerprint,
                                     const std::string& ip) = 0;

    /**
     * @brief Явное уведомление о смене IP
     * @throws NotFoundError по тем же правилам, что reconnect
     */
    virtual domain::Device changeIp(const domain::ClientIdentity& caller,
                                    const std::string& deviceId,
                                    const std::string& newIp) = 0;

    /**
     * @brief Последние смены IP устройства, новые первыми
     * @throws ValidationError если limit вне 1..100
     * @throws NotFoundError если устройства нет
     */
    virtual std::vector<domain::IpChange> ipHistory(const std::string& deviceId, int limit) = 0;

    /**
     * @brief Клиент сообщает о своём присутствии
     *
     * Первое объявление с нового адреса рассылается уведомлением.
     * @throws ValidationError если name пуст
     */
    virtual AnnounceResult announce(const domain::ClientIdentity& caller,
                                    const std::string& name,
                                    const std::string& ip) = 0;
};

} // namespace hostlink::ports::input
