#pragma once

#include "../stub/StubQuoteApi.hpp"
#include <memo/Memo.hpp>
#include <memo/listeners/StatsListener.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

/**
 * @brief Сервис котировок с мемоизацией запросов к API
 *
 * Кэши (пространство имён "market"):
 * - market::lotSize    — справочные данные, без истечения
 * - market::lastPrice  — цена, короткий timeout
 * - market::bidAsk     — две цены за вызов, общее хранилище реестра
 * - market::spread     — общее хранилище реестра
 * - market::session    — single-slot, аргументов нет
 */
class QuoteService {
public:
    QuoteService(std::shared_ptr<StubQuoteApi> api,
                 CacheRegistry& registry,
                 MemoCache::Duration priceTimeout = std::chrono::seconds(1))
        : api_(std::move(api))
        , registry_(registry)
        , stats_(std::make_shared<StatsListener>())
    {
        registry_.addListener(stats_);

        lotSize_ = memo::createCache(registry_, "market::lotSize", std::nullopt,
            StorageKind::Map, false,
            [api = api_](const Values& args) {
                return Values{api->lotSize(args[0].asString())};
            });

        lastPrice_ = memo::createCache(registry_, "market::lastPrice", priceTimeout,
            StorageKind::Map, false,
            [api = api_](const Values& args) {
                return Values{api->lastPrice(args[0].asString())};
            });

        bidAsk_ = memo::createCache(registry_, "market::bidAsk", priceTimeout,
            StorageKind::Map, true,
            [api = api_](const Values& args) {
                auto [bid, ask] = api->bestBidAsk(args[0].asString());
                return Values{bid, ask};
            });

        spread_ = memo::createCache(registry_, "market::spread", priceTimeout,
            StorageKind::Map, true,
            [api = api_](const Values& args) {
                auto [bid, ask] = api->bestBidAsk(args[0].asString());
                return Values{ask - bid};
            });

        session_ = memo::createCache(registry_, "market::session", std::chrono::seconds(30),
            StorageKind::SingleSlot, false,
            [api = api_](const Values&) {
                return Values{api->sessionStatus()};
            });
    }

    int lotSize(const std::string& ticker) {
        return static_cast<int>(lotSize_->invokeOne({ticker}).asInt());
    }

    double lastPrice(const std::string& ticker) {
        return lastPrice_->invokeOne({ticker}).asDouble();
    }

    std::pair<double, double> bidAsk(const std::string& ticker) {
        Values result = bidAsk_->invoke({ticker});
        return {result[0].asDouble(), result[1].asDouble()};
    }

    double spread(const std::string& ticker) {
        return spread_->invokeOne({ticker}).asDouble();
    }

    std::string session() {
        return session_->invokeOne({}).asString();
    }

    /**
     * @brief Последняя известная цена, даже устаревшая
     */
    std::optional<double> cachedPrice(const std::string& ticker) const {
        auto entry = lastPrice_->peek({ticker});
        if (!entry || entry->values.empty()) {
            return std::nullopt;
        }
        return entry->values.front().asDouble();
    }

    void dropPrice(const std::string& ticker) { lastPrice_->clear({ticker}); }
    void dropBidAsk() { bidAsk_->clear(); }

    void printStats() const {
        std::cout << std::fixed << std::setprecision(1);
        std::cout << "  Cache: hits=" << stats_->hits()
                  << " misses=" << stats_->misses()
                  << " expired=" << stats_->expirations()
                  << " hit rate=" << (stats_->hitRate() * 100) << "%\n";
        std::cout << "  API requests: " << api_->totalRequests() << "\n";
    }

private:
    std::shared_ptr<StubQuoteApi> api_;
    CacheRegistry& registry_;
    std::shared_ptr<StatsListener> stats_;
    CacheHandle lotSize_;
    CacheHandle lastPrice_;
    CacheHandle bidAsk_;
    CacheHandle spread_;
    CacheHandle session_;
};
