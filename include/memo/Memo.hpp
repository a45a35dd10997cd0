#pragma once

#include <memo/MemoCache.hpp>
#include <memo/config/CacheOptions.hpp>
#include <memo/registry/CacheRegistry.hpp>
#include <optional>
#include <string>

/**
 * @brief Функциональный фасад над CacheRegistry / MemoCache
 *
 * Точка входа для кода, который связывает именованные функции с кэшами
 * (генераторы обёрток, макросы и т.п.). Реестр передаётся явно.
 * Функции вызываются с квалификацией: memo::invoke(handle, args).
 *
 * Остальные типы библиотеки глобальные; в namespace вынесен только фасад:
 * свободные invoke/clear без него конфликтовали бы с std::invoke (ADL
 * по std::shared_ptr) и с clear() пользовательского кода.
 */
namespace memo {

/**
 * @brief Создать и зарегистрировать кэш
 * @param timeout nullopt — записи не истекают
 * @param shared Разделять общее хранилище реестра (только StorageKind::Map)
 */
inline CacheHandle createCache(CacheRegistry& registry,
                               const std::string& name,
                               std::optional<MemoCache::Duration> timeout,
                               StorageKind kind,
                               bool shared,
                               MemoCache::Function function) {
    CacheOptions options;
    options.name = name;
    options.timeout = timeout;
    options.kind = kind;
    options.sharedResults = shared;
    return registry.create(std::move(options), std::move(function));
}

inline Values invoke(const CacheHandle& cache, const Values& args) {
    return cache->invoke(args);
}

inline size_t clear(const CacheHandle& cache) {
    return cache->clear();
}

inline size_t clear(const CacheHandle& cache, const Values& args) {
    return cache->clear(args);
}

inline size_t clearAll(CacheRegistry& registry,
                       const std::optional<std::string>& namespaceFilter = std::nullopt) {
    return registry.clearAll(namespaceFilter);
}

}  // namespace memo
