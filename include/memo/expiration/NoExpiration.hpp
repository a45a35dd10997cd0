#pragma once

#include "IExpirationPolicy.hpp"

/**
 * @brief Политика без истечения срока действия
 *
 * Записи живут вечно (пока не будут явно очищены).
 * Поведение по умолчанию для кэша без timeout.
 *
 * @note Это null-object pattern — безопасная заглушка вместо nullptr.
 */
class NoExpiration : public IExpirationPolicy {
public:
    /**
     * @return false для существующей записи, true — если записи нет
     */
    bool isExpired(std::optional<TimePoint> storedAt, TimePoint now) const override {
        (void)now;
        return !storedAt.has_value();
    }

    std::optional<Duration> timeToLive(std::optional<TimePoint> storedAt,
                                       TimePoint now) const override {
        (void)storedAt;
        (void)now;
        return std::nullopt;  // Бесконечный TTL
    }

    std::optional<Duration> timeout() const override {
        return std::nullopt;
    }
};
