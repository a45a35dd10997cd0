#pragma once

#include <memo/value/Value.hpp>
#include <chrono>

/**
 * @brief Запись кэша: полный набор результатов одного вызова + время записи
 *
 * values — всегда вся упорядоченная последовательность возвращённых значений
 * (функция может вернуть несколько результатов), а не только первый.
 */
struct CacheEntry {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    Values values;
    TimePoint storedAt;
};
