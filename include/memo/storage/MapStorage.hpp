#pragma once

#include <memo/storage/IStorage.hpp>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

/**
 * @brief Потокобезопасный словарь ключ → запись
 *
 * Синхронизация через shared_mutex:
 * - get, size, keys — shared lock (много читателей)
 * - set, remove, clear — exclusive lock (один писатель)
 *
 * Один экземпляр может разделяться несколькими кэшами (std::shared_ptr).
 * Тогда ключи содержат имя владельца, см. CacheKey::owner.
 *
 * @code
 *   auto pool = std::make_shared<MapStorage>();
 *   // Оба кэша пишут в pool, их записи различаются по owner
 * @endcode
 */
class MapStorage : public IStorage {
public:
    std::optional<CacheEntry> get(const CacheKey& key) const override {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Записать результаты (last-write-wins при гонке)
     */
    TimePoint set(const CacheKey& key, Values values) override {
        TimePoint now = CacheEntry::Clock::now();
        std::unique_lock lock(mutex_);
        entries_[key] = CacheEntry{std::move(values), now};
        return now;
    }

    bool remove(const CacheKey& key) override {
        std::unique_lock lock(mutex_);
        return entries_.erase(key) > 0;
    }

    size_t clear() override {
        std::unique_lock lock(mutex_);
        size_t count = entries_.size();
        entries_.clear();
        return count;
    }

    /**
     * @brief Удалить записи по предикату
     *
     * Двухфазно: сначала под shared lock собираем подходящие ключи,
     * затем удаляем каждый под отдельным exclusive lock.
     * Хранилище не блокируется целиком на время сканирования.
     * Запись, вставленная между фазами, не удаляется.
     */
    size_t removeIf(const KeyPredicate& predicate) override {
        if (!predicate) {
            return 0;
        }

        std::vector<CacheKey> matching;
        {
            std::shared_lock lock(mutex_);
            for (const auto& [key, entry] : entries_) {
                (void)entry;
                if (predicate(key)) {
                    matching.push_back(key);
                }
            }
        }

        size_t count = 0;
        for (const auto& key : matching) {
            if (remove(key)) {
                ++count;
            }
        }
        return count;
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    /**
     * @brief Снимок всех ключей (для отладки и тестов)
     */
    std::vector<CacheKey> keys() const {
        std::shared_lock lock(mutex_);
        std::vector<CacheKey> result;
        result.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            (void)entry;
            result.push_back(key);
        }
        return result;
    }

private:
    std::unordered_map<CacheKey, CacheEntry> entries_;
    mutable std::shared_mutex mutex_;
};
