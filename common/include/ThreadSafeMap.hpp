#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <utility>
#include <cstddef>

/**
 * @brief Потокобезопасная map с shared_ptr значениями
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Составные операции (find-or-insert, replace-if, erase-if) выполняются
 * под одной блокировкой и поэтому атомарны относительно друг друга.
 */
template <typename K, typename V, typename Hash = std::hash<K>>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    /**
     * @brief Вставить, если ключа ещё нет
     * @return {true, value} если вставили, {false, текущее значение} если ключ уже был
     */
    std::pair<bool, std::shared_ptr<V>> findOrInsert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.emplace(key, value);
        return {inserted, it->second};
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Заменить значение, если текущее удовлетворяет предикату
     */
    template <typename Pred>
    bool replaceIf(const K &key, Pred pred, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !pred(*it->second))
            return false;
        it->second = value;
        return true;
    }

    template <typename Pred>
    bool eraseIf(const K &key, Pred pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !pred(*it->second))
            return false;
        map_.erase(it);
        return true;
    }

    /**
     * @brief Удалить все значения, удовлетворяющие предикату
     * @return количество удалённых
     */
    template <typename Pred>
    std::size_t eraseWhere(Pred pred)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        std::size_t erased = 0;
        for (auto it = map_.begin(); it != map_.end();)
        {
            if (pred(*it->second))
            {
                it = map_.erase(it);
                ++erased;
            }
            else
            {
                ++it;
            }
        }
        return erased;
    }

    std::size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>, Hash> map_;
};
