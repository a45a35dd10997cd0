#pragma once

#include <memo/listeners/ICacheListener.hpp>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики кэша
 *
 * Собирает:
 * - hits/misses — для расчёта hit rate
 * - expirations/stores/removes/clears/errors — для анализа поведения
 *
 * Один слушатель можно повесить на несколько кэшей (через реестр) —
 * тогда счётчики суммарные.
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
class StatsListener : public ICacheListener {
public:
    void onHit(const std::string& cache, const CacheKey& key) override {
        (void)cache; (void)key;
        ++hits_;
    }

    void onMiss(const std::string& cache, const CacheKey& key) override {
        (void)cache; (void)key;
        ++misses_;
    }

    void onExpire(const std::string& cache, const CacheKey& key) override {
        (void)cache; (void)key;
        ++expirations_;
    }

    void onStore(const std::string& cache, const CacheKey& key, const Values& values) override {
        (void)cache; (void)key; (void)values;
        ++stores_;
    }

    void onRemove(const std::string& cache, const CacheKey& key) override {
        (void)cache; (void)key;
        ++removes_;
    }

    void onClear(const std::string& cache, size_t count) override {
        (void)cache; (void)count;
        ++clears_;
    }

    void onError(const std::string& cache, const CacheKey& key, const std::string& what) override {
        (void)cache; (void)key; (void)what;
        ++errors_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t expirations() const { return expirations_; }
    uint64_t stores() const { return stores_; }
    uint64_t removes() const { return removes_; }
    uint64_t clears() const { return clears_; }
    uint64_t errors() const { return errors_; }

    /**
     * @brief Общее количество вызовов invoke()
     */
    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Доля попаданий в кэш (0.0 - 1.0)
     * @return hit rate или 0.0, если вызовов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        expirations_ = 0;
        stores_ = 0;
        removes_ = 0;
        clears_ = 0;
        errors_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> errors_{0};
};
