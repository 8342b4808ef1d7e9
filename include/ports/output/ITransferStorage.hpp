#pragma once

#include "domain/TransferSession.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hostlink::ports::output {

/**
 * @brief Результат stat() для файла на хосте
 */
struct FileStat {
    std::uint64_t size = 0;
    int64_t modifiedAt = 0;  ///< нс, сравнивается только на равенство
    bool isRegularFile = false;
    bool isDirectory = false;
};

/**
 * @brief Хранилище сессий передачи и файловых данных
 *
 * Output Port. Отвечает за дескрипторы {id}.meta, частичные файлы
 * {id}.part и за чтение/stat произвольных файлов хоста. Все вызовы
 * блокирующие, сервис выполняет их в пуле ввода-вывода.
 * Ошибки файловой системы бросаются как InternalError.
 */
class ITransferStorage {
public:
    virtual ~ITransferStorage() = default;

    // ---- дескрипторы сессий ----

    virtual void saveSession(const domain::TransferSession& session) = 0;

    /**
     * @brief Прочитать все дескрипторы данного направления
     *
     * Повреждённые дескрипторы пропускаются (и логируются).
     */
    virtual std::vector<domain::TransferSession> loadSessions(domain::TransferKind kind) = 0;

    /**
     * @brief Удалить дескриптор и (для upload) частичный файл. Идемпотентно
     */
    virtual void removeSession(domain::TransferKind kind, const std::string& transferId) = 0;

    /**
     * @brief Удалить файлы сессий старше maxAge, не входящие в liveIds
     * @return Сколько сессий удалено
     */
    virtual std::size_t sweepOrphans(domain::TransferKind kind,
                                     std::chrono::seconds maxAge,
                                     const std::set<std::string>& liveIds) = 0;

    // ---- частичные файлы upload ----

    virtual void createPart(const std::string& transferId) = 0;

    /**
     * @brief Размер .part или nullopt, если файла нет
     */
    virtual std::optional<std::uint64_t> partSize(const std::string& transferId) = 0;

    virtual void appendPart(const std::string& transferId, const std::string& bytes) = 0;

    /**
     * @brief Атомарно перенести .part в итоговый путь (с перезаписью)
     */
    virtual void commitPart(const std::string& transferId, const std::string& finalPath) = 0;

    // ---- файлы хоста ----

    virtual std::optional<FileStat> stat(const std::string& path) = 0;

    virtual std::string readRange(const std::string& path, std::uint64_t offset, std::uint64_t length) = 0;
};

} // namespace hostlink::ports::output
