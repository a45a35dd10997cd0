#pragma once

#include <memo/CacheEntry.hpp>
#include <memo/key/CacheKey.hpp>
#include <cstddef>
#include <functional>
#include <optional>

/**
 * @brief Интерфейс хранилища результатов
 *
 * Ровно две реализации, выбираются при создании кэша и не меняются:
 * - SingleSlotStorage — одна запись, ключ игнорируется
 * - MapStorage        — словарь ключ → запись, может быть общим для нескольких кэшей
 *
 * Все методы должны быть безопасны при конкурентных вызовах.
 */
class IStorage {
public:
    using TimePoint = CacheEntry::TimePoint;
    using KeyPredicate = std::function<bool(const CacheKey&)>;

    virtual ~IStorage() = default;

    /**
     * @brief Найти запись
     * @return Запись или std::nullopt, если её нет
     */
    virtual std::optional<CacheEntry> get(const CacheKey& key) const = 0;

    /**
     * @brief Записать (или перезаписать) результаты с текущим временем
     * @return Время записи
     */
    virtual TimePoint set(const CacheKey& key, Values values) = 0;

    /**
     * @brief Удалить одну запись
     * @return true, если запись существовала
     */
    virtual bool remove(const CacheKey& key) = 0;

    /**
     * @brief Удалить все записи
     * @return Количество удалённых записей
     */
    virtual size_t clear() = 0;

    /**
     * @brief Удалить записи, ключи которых удовлетворяют предикату
     * @return Количество удалённых записей
     */
    virtual size_t removeIf(const KeyPredicate& predicate) = 0;

    virtual size_t size() const = 0;
};
