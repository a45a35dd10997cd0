#pragma once

#include <memo/CacheEntry.hpp>
#include <chrono>
#include <optional>

/**
 * @brief Интерфейс политики истечения срока действия (TTL)
 *
 * В отличие от классического кэша, политика не хранит метаданных по ключам:
 * время записи лежит в самой CacheEntry. Политика — чистая функция
 * от (время записи, текущее время), без блокировок.
 *
 * Точка интеграции с MemoCache:
 * - invoke(): сразу после get() из хранилища вызывается isExpired()
 *
 * Стратегия проверки — lazy expiration: проверка при обращении,
 * фоновой очистки нет.
 */
class IExpirationPolicy {
public:
    using Clock = CacheEntry::Clock;
    using TimePoint = CacheEntry::TimePoint;
    using Duration = Clock::duration;

    virtual ~IExpirationPolicy() = default;

    /**
     * @brief Проверить, устарела ли запись
     * @param storedAt Время записи или std::nullopt, если записи нет
     * @param now Текущее время
     * @return true, если значение нужно пересчитать
     *
     * Отсутствующая запись всегда считается устаревшей.
     */
    virtual bool isExpired(std::optional<TimePoint> storedAt, TimePoint now) const = 0;

    /**
     * @brief Оставшееся время жизни записи
     * @return nullopt — бесконечно (или записи нет), zero — уже истекла
     *
     * Полезно для отладки и мониторинга.
     */
    virtual std::optional<Duration> timeToLive(std::optional<TimePoint> storedAt,
                                               TimePoint now) const = 0;

    /**
     * @brief Настроенный таймаут, nullopt — без истечения
     */
    virtual std::optional<Duration> timeout() const = 0;
};
