#pragma once

#include <memo/value/Value.hpp>
#include <functional>
#include <ostream>
#include <string>

/**
 * @brief Ключ записи в хранилище
 *
 * - owner — имя кэша-владельца; заполняется только для кэшей с общим
 *   хранилищем (sharedResults), иначе пустая строка
 * - args  — канонизированный кортеж аргументов (всегда список)
 *
 * Пара (owner, args) уникальна внутри общего хранилища: одинаковые аргументы
 * разных кэшей дают разные ключи.
 */
struct CacheKey {
    std::string owner;
    Value args;

    bool operator==(const CacheKey& other) const {
        return owner == other.owner && args == other.args;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    bool isOwnedBy(const std::string& name) const { return owner == name; }
};

inline std::ostream& operator<<(std::ostream& os, const CacheKey& key) {
    if (!key.owner.empty()) {
        os << key.owner << ':';
    }
    return os << key.args;
}

namespace std {
template<>
struct hash<CacheKey> {
    size_t operator()(const CacheKey& key) const {
        size_t h = std::hash<std::string>{}(key.owner);
        return h ^ (key.args.hash() + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
}
