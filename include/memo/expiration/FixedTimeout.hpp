#pragma once

#include "IExpirationPolicy.hpp"
#include <algorithm>
#include <cstdint>
#include <stdexcept>

/**
 * @brief Политика с фиксированным временем жизни записи
 *
 * Все записи кэша живут одинаковое время от момента записи.
 *
 * Алгоритм:
 * - expired  ⇔  now - storedAt > timeout
 * - storedAt + timeout не вычисляется: timeout может быть Duration::max()
 * - Обращение к записи (hit) таймер НЕ сбрасывает
 *
 * @code
 *   auto policy = std::make_unique<FixedTimeout>(std::chrono::seconds(5));
 * @endcode
 */
class FixedTimeout : public IExpirationPolicy {
public:
    /**
     * @param timeout Время жизни записей
     * @throws std::invalid_argument если timeout <= 0
     */
    explicit FixedTimeout(Duration timeout) : timeout_(timeout) {
        if (timeout <= Duration::zero()) {
            throw std::invalid_argument("Timeout must be positive");
        }
    }

    /**
     * @brief Конструктор с timeout в секундах (удобство)
     */
    explicit FixedTimeout(int64_t seconds)
        : FixedTimeout(std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds))) {}

    bool isExpired(std::optional<TimePoint> storedAt, TimePoint now) const override {
        if (!storedAt) {
            return true;
        }
        return now - *storedAt > timeout_;
    }

    std::optional<Duration> timeToLive(std::optional<TimePoint> storedAt,
                                       TimePoint now) const override {
        if (!storedAt) {
            return std::nullopt;
        }

        Duration elapsed = std::max(now - *storedAt, Duration::zero());
        if (elapsed > timeout_) {
            return Duration::zero();  // Уже истёк
        }
        return timeout_ - elapsed;
    }

    std::optional<Duration> timeout() const override {
        return timeout_;
    }

private:
    Duration timeout_;
};
