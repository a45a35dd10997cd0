#pragma once

#include "ICacheListener.hpp"
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша
 *
 * Формат строки: "[prefix] EVENT: cache key ..."
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener>("memo");
 *   registry.addListener(logger);
 *
 * Для отключения логирования в бенчмарках — просто не добавляем слушателя.
 */
class LoggingListener : public ICacheListener {
public:
    /**
     * @param prefix Префикс для всех сообщений
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "memo",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onHit(const std::string& cache, const CacheKey& key) override {
        write("HIT", cache, key);
    }

    void onMiss(const std::string& cache, const CacheKey& key) override {
        write("MISS", cache, key);
    }

    void onExpire(const std::string& cache, const CacheKey& key) override {
        write("EXPIRE", cache, key);
    }

    void onStore(const std::string& cache, const CacheKey& key, const Values& values) override {
        std::lock_guard lock(mutex_);
        os_ << "[" << prefix_ << "] STORE: " << cache << " " << key
            << " = " << values << "\n";
    }

    void onRemove(const std::string& cache, const CacheKey& key) override {
        write("REMOVE", cache, key);
    }

    void onClear(const std::string& cache, size_t count) override {
        std::lock_guard lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR: " << cache << " " << count << " entries\n";
    }

    void onError(const std::string& cache, const CacheKey& key, const std::string& what) override {
        std::lock_guard lock(mutex_);
        os_ << "[" << prefix_ << "] ERROR: " << cache << " " << key << " " << what << "\n";
    }

    void onStorageUnavailable(const std::string& cache) override {
        std::lock_guard lock(mutex_);
        os_ << "[" << prefix_ << "] NO STORAGE: " << cache << " (results are not cached)\n";
    }

private:
    void write(const char* event, const std::string& cache, const CacheKey& key) {
        std::lock_guard lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << cache << " " << key << "\n";
    }

    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
