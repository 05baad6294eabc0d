#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <unordered_map>
#include <utility>

/**
 * @brief Таблица блокировок по ключу
 *
 * Сериализует владельцев одного ключа и не мешает владельцам разных ключей.
 * Запись для ключа живёт, пока ключ удерживается или его кто-то ждёт,
 * поэтому таблица не растёт вместе с числом когда-либо встреченных ключей.
 *
 * Захват всегда ограничен по времени: tryLockFor() возвращает пустой Guard,
 * если ключ не освободился за отведённый timeout.
 */
template <typename K>
class KeyedLockTable
{
public:
    /**
     * @brief RAII-владение ключом, освобождает ключ в деструкторе
     */
    class Guard
    {
    public:
        Guard() = default;

        Guard(Guard &&other) noexcept
            : table_(std::exchange(other.table_, nullptr)), key_(std::move(other.key_)) {}

        Guard &operator=(Guard &&other) noexcept
        {
            if (this != &other)
            {
                release();
                table_ = std::exchange(other.table_, nullptr);
                key_ = std::move(other.key_);
            }
            return *this;
        }

        Guard(const Guard &) = delete;
        Guard &operator=(const Guard &) = delete;

        ~Guard() { release(); }

        bool owns() const { return table_ != nullptr; }
        explicit operator bool() const { return owns(); }

        void release()
        {
            if (table_)
            {
                table_->unlock(key_);
                table_ = nullptr;
            }
        }

    private:
        friend class KeyedLockTable;

        Guard(KeyedLockTable *table, K key) : table_(table), key_(std::move(key)) {}

        KeyedLockTable *table_ = nullptr;
        K key_;
    };

    KeyedLockTable() = default;
    KeyedLockTable(const KeyedLockTable &) = delete;
    KeyedLockTable &operator=(const KeyedLockTable &) = delete;

    /**
     * @brief Захватить ключ, ожидая не дольше timeout
     * @return Владеющий Guard или пустой Guard по истечении timeout
     */
    Guard tryLockFor(const K &key, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        Entry &entry = entries_[key];

        ++entry.waiters;
        bool acquired = entry.released.wait_for(lock, timeout, [&entry]()
                                                { return !entry.locked; });
        --entry.waiters;

        if (!acquired)
        {
            if (!entry.locked && entry.waiters == 0)
            {
                entries_.erase(key);
            }
            return Guard();
        }

        entry.locked = true;
        return Guard(this, key);
    }

    /**
     * @brief Удерживается ли ключ сейчас
     */
    bool isLocked(const K &key) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && it->second.locked;
    }

    /**
     * @brief Число живых записей (удерживаемых или ожидаемых ключей)
     */
    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry
    {
        bool locked = false;
        size_t waiters = 0;
        std::condition_variable released;
    };

    void unlock(const K &key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
        {
            return;
        }

        it->second.locked = false;
        if (it->second.waiters == 0)
        {
            entries_.erase(it);
        }
        else
        {
            it->second.released.notify_one();
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<K, Entry> entries_;
};
