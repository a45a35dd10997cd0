#pragma once

#include <memo/storage/IStorage.hpp>
#include <mutex>
#include <optional>
#include <shared_mutex>

/**
 * @brief Хранилище на одну запись
 *
 * Для функций без аргументов (или не зависящих от них).
 * Ключ во всех операциях игнорируется: слот один.
 */
class SingleSlotStorage : public IStorage {
public:
    std::optional<CacheEntry> get(const CacheKey& key) const override {
        (void)key;
        std::shared_lock lock(mutex_);
        return slot_;
    }

    TimePoint set(const CacheKey& key, Values values) override {
        (void)key;
        TimePoint now = CacheEntry::Clock::now();
        std::unique_lock lock(mutex_);
        slot_ = CacheEntry{std::move(values), now};
        return now;
    }

    /**
     * @brief Сбрасывает слот независимо от переданного ключа
     */
    bool remove(const CacheKey& key) override {
        (void)key;
        return reset() > 0;
    }

    size_t clear() override {
        return reset();
    }

    /**
     * @brief Слот не имеет ключа — предикат проверяется на пустом ключе
     */
    size_t removeIf(const KeyPredicate& predicate) override {
        if (!predicate || !predicate(CacheKey{})) {
            return 0;
        }
        return reset();
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return slot_.has_value() ? 1 : 0;
    }

private:
    size_t reset() {
        std::unique_lock lock(mutex_);
        size_t count = slot_.has_value() ? 1 : 0;
        slot_.reset();
        return count;
    }

    std::optional<CacheEntry> slot_;
    mutable std::shared_mutex mutex_;
};
