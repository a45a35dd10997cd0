#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

/**
 * @brief Ошибка превышения лимита запросов
 */
class RateLimitExceeded : public std::runtime_error {
public:
    RateLimitExceeded() : std::runtime_error("API rate limit exceeded") {}
};

/**
 * @brief Заглушка биржевого API для демонстрации
 *
 * Имитирует поведение реального API:
 * - Лимит запросов (requestsLimit на весь срок жизни заглушки)
 * - Сетевые задержки (опционально)
 * - Цены генерируются случайно в диапазоне ±3% от базовой
 */
class StubQuoteApi {
public:
    explicit StubQuoteApi(int requestsLimit = 1000, bool simulateDelay = false)
        : requestsLimit_(requestsLimit)
        , simulateDelay_(simulateDelay)
        , rng_(std::random_device{}())
        , basePrices_{{"SBER", 300.0}, {"GAZP", 150.0}, {"LKOH", 7000.0}}
    {}

    /**
     * @brief Последняя цена инструмента
     * @throws RateLimitExceeded если лимит исчерпан
     * @throws std::runtime_error если тикер неизвестен
     */
    double lastPrice(const std::string& ticker) {
        double base = request(ticker);
        std::lock_guard lock(rngMutex_);
        std::uniform_real_distribution<double> spread(-0.03, 0.03);
        return base * (1.0 + spread(rng_));
    }

    /**
     * @brief Лучшие цены покупки и продажи
     */
    std::pair<double, double> bestBidAsk(const std::string& ticker) {
        double price = lastPrice(ticker);
        return {price * 0.999, price * 1.001};
    }

    /**
     * @brief Размер лота (справочные данные, не меняются)
     */
    int lotSize(const std::string& ticker) {
        request(ticker);
        return ticker == "LKOH" ? 1 : 10;
    }

    /**
     * @brief Состояние торговой сессии
     */
    std::string sessionStatus() {
        checkRateLimit();
        return "open";
    }

    int totalRequests() const { return totalRequests_; }

private:
    double request(const std::string& ticker) {
        checkRateLimit();
        if (simulateDelay_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        auto it = basePrices_.find(ticker);
        if (it == basePrices_.end()) {
            throw std::runtime_error("Instrument not found: " + ticker);
        }
        return it->second;
    }

    void checkRateLimit() {
        if (totalRequests_ >= requestsLimit_) {
            throw RateLimitExceeded();
        }
        ++totalRequests_;
    }

    int requestsLimit_;
    bool simulateDelay_;
    std::mt19937 rng_;
    std::mutex rngMutex_;
    std::unordered_map<std::string, double> basePrices_;
    std::atomic<int> totalRequests_{0};
};
