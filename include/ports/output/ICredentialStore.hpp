#pragma once

#include "domain/Device.hpp"
#include <optional>
#include <string>
#include <vector>

namespace hostlink::ports::output {

/**
 * @brief Хранилище устройств и мастер-ключа
 *
 * Output Port. Чистый доступ к данным, без логики протокола.
 * Каждая мутация сохраняется синхронно, до возврата из метода.
 */
class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;

    /**
     * @brief Найти устройство по выданному ключу
     *
     * Возвращает устройство независимо от одобрения, решение принимает
     * вызывающая сторона (Authenticator).
     */
    virtual std::optional<domain::Device> lookupByKey(const std::string& apiKey) = 0;

    virtual std::optional<domain::Device> findById(const std::string& deviceId) = 0;

    /**
     * @brief Зарегистрировать кандидата (идемпотентно по device_id)
     *
     * Для уже известного устройства обновляет имя, fingerprint, платформу,
     * версию и IP, не трогая одобрение и ключ.
     */
    virtual domain::Device registerDevice(const domain::DeviceRegistration& registration) = 0;

    /**
     * @brief Одобрить устройство и выдать ему новый ключ
     * @throws NotFoundError если устройства нет
     */
    virtual domain::Device approve(const std::string& deviceId) = 0;

    /**
     * @brief Удалить устройство
     * @return true если устройство было
     */
    virtual bool revoke(const std::string& deviceId) = 0;

    /**
     * @brief Обновить IP и last_seen
     */
    virtual void touch(const std::string& deviceId, const std::string& ip) = 0;

    virtual std::vector<domain::Device> listAll() = 0;

    virtual std::string masterKey() = 0;
};

} // namespace hostlink::ports::output
