#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасная таблица сессий (ключ -> shared_ptr на состояние)
 *
 * Читатели берут shared_lock, писатели unique_lock. Значения отдаются
 * как shared_ptr, поэтому объект живёт, пока им пользуется хотя бы один
 * поток, даже если ключ уже удалён из таблицы.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Удалить ключ и вернуть удалённое значение (nullptr если не было)
     */
    std::shared_ptr<V> erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end())
            return nullptr;
        auto value = it->second;
        map_.erase(it);
        return value;
    }

    /**
     * @brief Снимок всех значений на момент вызова
     *
     * Итерация по снимку не держит блокировку, так что параллельные
     * insert/erase не инвалидируют обход.
     */
    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
            result.push_back(value);
        return result;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
