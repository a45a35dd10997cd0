#pragma once

#include <memo/key/CacheKey.hpp>
#include <memo/value/Value.hpp>
#include <cmath>
#include <limits>
#include <string>

/**
 * @brief Канонизация значения аргумента
 *
 * Правила:
 * - nil        → nil
 * - список     → новый список из канонизированных элементов (порядок сохраняется)
 * - -0.0       → 0.0 (иначе равные числа давали бы разный хэш)
 * - любой NaN  → quiet NaN (один ключ на все NaN)
 * - остальное  → само значение
 *
 * Результат зависит только от структуры: два разных объекта-списка
 * с равными элементами дают равные канонические формы.
 */
inline Value canonicalize(const Value& value) {
    if (value.isNil()) {
        return Value::nil();
    }
    if (value.isList()) {
        const auto& items = value.asList();
        Value::List canonical;
        canonical.reserve(items.size());
        for (const auto& item : items) {
            canonical.push_back(canonicalize(item));
        }
        return Value(std::move(canonical));
    }
    if (value.isDouble() && std::isnan(value.asDouble())) {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }
    if (value.isDouble() && value.asDouble() == 0.0) {
        return Value(0.0);
    }
    return value;
}

/**
 * @brief Построить ключ для кортежа аргументов
 * @param args Аргументы вызова
 * @param owner Имя кэша для общего хранилища, пустая строка — без префикса
 */
inline CacheKey deriveKey(const Values& args, const std::string& owner = {}) {
    return CacheKey{owner, canonicalize(Value(Value::List(args)))};
}
