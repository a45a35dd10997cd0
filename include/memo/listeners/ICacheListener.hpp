#pragma once

#include <memo/key/CacheKey.hpp>
#include <cstddef>
#include <string>

/**
 * @brief Интерфейс слушателя событий кэша
 *
 * Все методы имеют пустую реализацию по умолчанию — переопределяются
 * только нужные. Вызываются синхронно из потока, выполняющего операцию,
 * поэтому реализации должны быть потокобезопасными.
 */
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const std::string& cache, const CacheKey& key) { (void)cache; (void)key; }
    virtual void onMiss(const std::string& cache, const CacheKey& key) { (void)cache; (void)key; }

    /// Запись была, но устарела (после onExpire следует onMiss)
    virtual void onExpire(const std::string& cache, const CacheKey& key) { (void)cache; (void)key; }

    virtual void onStore(const std::string& cache, const CacheKey& key, const Values& values) {
        (void)cache; (void)key; (void)values;
    }
    virtual void onRemove(const std::string& cache, const CacheKey& key) { (void)cache; (void)key; }
    virtual void onClear(const std::string& cache, size_t count) { (void)cache; (void)count; }

    /// Вычисляемая функция бросила исключение (оно будет проброшено дальше)
    virtual void onError(const std::string& cache, const CacheKey& key, const std::string& what) {
        (void)cache; (void)key; (void)what;
    }

    /// Хранилище не создано — кэш работает без сохранения результатов
    virtual void onStorageUnavailable(const std::string& cache) { (void)cache; }
};
