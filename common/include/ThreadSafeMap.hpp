#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <utility>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная хэш-таблица
 *
 * Читатели берут shared_lock, писатели — unique_lock.
 * Значения хранятся через shared_ptr: читатель получает снимок,
 * который остаётся валидным даже после erase() другим потоком.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Удалить ключ
     * @return true если ключ был в таблице
     */
    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * @brief Снимок всех пар на момент вызова
     */
    std::vector<std::pair<K, std::shared_ptr<V>>> snapshot() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return {map_.begin(), map_.end()};
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
