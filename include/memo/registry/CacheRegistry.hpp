#pragma once

#include <memo/MemoCache.hpp>
#include <memo/config/CacheOptions.hpp>
#include <memo/listeners/ICacheListener.hpp>
#include <memo/storage/MapStorage.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Реестр всех созданных кэшей
 *
 * - Только добавление: кэш регистрируется при создании и живёт,
 *   пока жив реестр
 * - Порядок создания сохраняется (clearAll обходит кэши в нём)
 * - Имена уникальны: на них держится разделение записей в общем хранилище
 * - Хранит общее хранилище по умолчанию для кэшей с sharedResults
 *
 * Синхронизация через shared_mutex: регистрация и addListener — exclusive
 * lock, find/size/снимки — shared lock. Пользовательский код (фабрика
 * хранилища, слушатели, очистка кэшей) выполняется без блокировки реестра,
 * поэтому слушатель может обращаться к реестру из колбэка.
 *
 * @code
 *   CacheRegistry registry;
 *   CacheOptions options;
 *   options.name = "geo::distance";
 *   auto distance = registry.create(options, computeDistance);
 *   distance->invoke({a, b});
 *   registry.clearAll("geo");
 * @endcode
 */
class CacheRegistry {
public:
    CacheRegistry()
        : sharedStorage_(std::make_shared<MapStorage>())
    {}

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /**
     * @brief Создать кэш и зарегистрировать его
     * @throws std::invalid_argument при ошибке конфигурации или повторном имени
     */
    CacheHandle create(CacheOptions options, MemoCache::Function function) {
        options.validate();

        // Фабрика хранилища и слушатели — пользовательский код,
        // кэш строится без блокировки реестра
        size_t knownListeners = 0;
        {
            std::shared_lock lock(mutex_);
            throwIfRegistered(options.name);
            for (const auto& listener : listeners_) {
                options.listeners.push_back(listener);
            }
            knownListeners = listeners_.size();
        }

        auto storage = MemoCache::materializeStorage(options, sharedStorage_);
        auto cache = std::make_shared<MemoCache>(std::move(options), std::move(function),
                                                 std::move(storage));

        std::vector<std::shared_ptr<ICacheListener>> lateListeners;
        {
            std::unique_lock lock(mutex_);
            throwIfRegistered(cache->name());
            byName_.emplace(cache->name(), cache);
            caches_.push_back(cache);
            lateListeners.assign(listeners_.begin() + knownListeners, listeners_.end());
        }

        // Слушатели, добавленные в реестр, пока кэш строился
        for (const auto& listener : lateListeners) {
            cache->addListener(listener);
        }
        return cache;
    }

    /**
     * @brief Найти кэш по имени
     * @return Дескриптор или nullptr
     */
    CacheHandle find(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = byName_.find(name);
        return (it != byName_.end()) ? it->second : nullptr;
    }

    bool contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return byName_.count(name) > 0;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return caches_.size();
    }

    /**
     * @brief Имена кэшей в порядке создания
     */
    std::vector<std::string> names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(caches_.size());
        for (const auto& cache : caches_) {
            result.push_back(cache->name());
        }
        return result;
    }

    /**
     * @brief Снимок всех кэшей в порядке создания
     */
    std::vector<CacheHandle> caches() const {
        std::shared_lock lock(mutex_);
        return caches_;
    }

    /**
     * @brief Полностью очистить кэши (clear() без аргументов)
     * @param namespaceFilter nullopt — все кэши; "" — только кэши без
     *        пространства имён; "a" — кэши из "a" и вложенных "a::..."
     * @return Количество очищенных кэшей
     */
    size_t clearAll(const std::optional<std::string>& namespaceFilter = std::nullopt) {
        size_t cleared = 0;
        for (const auto& cache : caches()) {
            if (namespaceFilter && !inNamespace(cache->name(), *namespaceFilter)) {
                continue;
            }
            cache->clear();
            ++cleared;
        }
        return cleared;
    }

    /**
     * @brief Подписать слушателя на все существующие и будущие кэши
     */
    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (!listener) {
            return;
        }

        std::vector<CacheHandle> existing;
        {
            std::unique_lock lock(mutex_);
            listeners_.push_back(listener);
            existing = caches_;
        }
        for (const auto& cache : existing) {
            cache->addListener(listener);
        }
    }

    /**
     * @brief Общее хранилище для кэшей с sharedResults без явного storage
     */
    std::shared_ptr<MapStorage> sharedStorage() const {
        return sharedStorage_;
    }

    /**
     * @brief Проверить принадлежность имени пространству имён
     *
     * inNamespace("geo::area", "geo") == true
     * inNamespace("geo::sphere::area", "geo") == true
     * inNamespace("geometry::area", "geo") == false
     */
    static bool inNamespace(const std::string& name, const std::string& filter) {
        std::string ns = namespaceOf(name);
        if (filter.empty()) {
            return ns.empty();
        }
        if (ns == filter) {
            return true;
        }
        return ns.size() > filter.size() + 1
            && ns.compare(0, filter.size(), filter) == 0
            && ns.compare(filter.size(), 2, "::") == 0;
    }

private:
    /// Вызывать под блокировкой mutex_
    void throwIfRegistered(const std::string& name) const {
        if (byName_.count(name) > 0) {
            throw std::invalid_argument("Cache '" + name + "' is already registered");
        }
    }

    std::shared_ptr<MapStorage> sharedStorage_;
    std::vector<CacheHandle> caches_;
    std::unordered_map<std::string, CacheHandle> byName_;
    std::vector<std::shared_ptr<ICacheListener>> listeners_;
    mutable std::shared_mutex mutex_;
};
