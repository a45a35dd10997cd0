#include "services/QuoteService.hpp"
#include <memo/listeners/LoggingListener.hpp>
#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация мемоизации на примере биржевых котировок
 *
 * Сценарии:
 * 1. Экономия API-запросов
 * 2. Истечение timeout
 * 3. Общее хранилище и выборочная очистка
 * 4. Ошибки API не кэшируются, устаревшие данные доступны через peek
 * 5. Очистка по пространству имён
 */

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void demoApiSavings() {
    printSeparator("Demo 1: API Request Savings");

    CacheRegistry registry;
    auto api = std::make_shared<StubQuoteApi>();
    QuoteService service(api, registry, std::chrono::seconds(5));

    const int requestCount = 50;
    std::cout << "Requesting SBER price " << requestCount << " times...\n\n";
    for (int i = 0; i < requestCount; ++i) {
        service.lastPrice("SBER");
    }

    service.printStats();
    std::cout << "Result: " << requestCount << " price requests, "
              << api->totalRequests() << " API call(s)\n";
}

void demoTimeout() {
    printSeparator("Demo 2: Timeout");

    CacheRegistry registry;
    auto api = std::make_shared<StubQuoteApi>();
    QuoteService service(api, registry, std::chrono::milliseconds(300));

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "t=0ms    SBER " << service.lastPrice("SBER")
              << " (API calls: " << api->totalRequests() << ")\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::cout << "t=100ms  SBER " << service.lastPrice("SBER")
              << " (API calls: " << api->totalRequests() << ", cached)\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::cout << "t=400ms  SBER " << service.lastPrice("SBER")
              << " (API calls: " << api->totalRequests() << ", expired)\n";
}

void demoSharedStorage() {
    printSeparator("Demo 3: Shared Storage");

    CacheRegistry registry;
    auto api = std::make_shared<StubQuoteApi>();
    auto logger = std::make_shared<LoggingListener>("market");
    registry.addListener(logger);
    QuoteService service(api, registry, std::chrono::seconds(5));

    for (const std::string ticker : {"SBER", "GAZP"}) {
        auto [bid, ask] = service.bidAsk(ticker);
        std::cout << std::fixed << std::setprecision(2)
                  << "  " << ticker << " bid " << bid << " ask " << ask
                  << " spread " << service.spread(ticker) << "\n";
    }

    std::cout << "\nShared storage entries: " << registry.sharedStorage()->size() << "\n";
    service.dropBidAsk();
    std::cout << "After clearing market::bidAsk: " << registry.sharedStorage()->size()
              << " (market::spread entries kept)\n";
}

void demoErrors() {
    printSeparator("Demo 4: Errors Are Not Cached");

    CacheRegistry registry;
    auto api = std::make_shared<StubQuoteApi>(1);
    QuoteService service(api, registry, std::chrono::milliseconds(50));

    service.lastPrice("SBER");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    for (int i = 0; i < 3; ++i) {
        try {
            service.lastPrice("SBER");
            std::cout << "Request " << (i + 1) << ": fresh price\n";
        } catch (const RateLimitExceeded& e) {
            auto stale = service.cachedPrice("SBER");
            std::cout << "Request " << (i + 1) << ": " << e.what();
            if (stale) {
                std::cout << ", last known price " << std::fixed << std::setprecision(2) << *stale;
            }
            std::cout << "\n";
        }
    }
}

void demoClearAll() {
    printSeparator("Demo 5: Clear by Namespace");

    CacheRegistry registry;
    auto api = std::make_shared<StubQuoteApi>();
    QuoteService service(api, registry, std::chrono::seconds(5));

    int other = 0;
    auto counter = memo::createCache(registry, "reports::daily", std::nullopt,
        StorageKind::SingleSlot, false,
        [&other](const Values&) { return Values{++other}; });

    service.lotSize("SBER");
    service.session();
    memo::invoke(counter, {});

    std::cout << "Registered caches:\n";
    for (const auto& name : registry.names()) {
        std::cout << "  " << name << "\n";
    }

    size_t cleared = memo::clearAll(registry, std::string("market"));
    std::cout << "\nCleared " << cleared << " caches in 'market'\n";

    memo::invoke(counter, {});
    std::cout << "reports::daily computed " << other << " time(s) (not cleared)\n";
}

int main() {
    std::cout << "=== Memoization Demo: Stock Quotes ===\n";

    try {
        demoApiSavings();
        demoTimeout();
        demoSharedStorage();
        demoErrors();
        demoClearAll();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
