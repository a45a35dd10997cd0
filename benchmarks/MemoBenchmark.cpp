#include <memo/MemoCache.hpp>
#include <memo/listeners/StatsListener.hpp>
#include <memo/registry/CacheRegistry.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк мемоизации
 *
 * Измеряем:
 * - Throughput попаданий и промахов (ops/sec)
 * - Стоимость ключей-списков по сравнению со скалярными
 * - Собственное vs общее хранилище
 * - Масштабирование по потокам
 * - Влияние слушателей на производительность
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

CacheOptions makeOptions(const std::string& name, bool shared = false) {
    CacheOptions options;
    options.name = name;
    options.sharedResults = shared;
    return options;
}

Values identity(const Values& args) {
    return args;
}

// ==================== Базовые бенчмарки ====================

void benchmarkMisses(size_t numOperations) {
    MemoCache cache(makeOptions("miss"), identity);

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.invoke({static_cast<int64_t>(i)});
        }
    });

    printResult("Invoke, unique args (100% miss)", timeMs, numOperations);
}

void benchmarkHits(size_t keyRange, size_t numOperations) {
    MemoCache cache(makeOptions("hit"), identity);
    for (size_t i = 0; i < keyRange; ++i) {
        cache.invoke({static_cast<int64_t>(i)});
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.invoke({static_cast<int64_t>(i % keyRange)});
        }
    });

    printResult("Invoke, warm cache (100% hit)", timeMs, numOperations);
}

void benchmarkListKeys(size_t keyRange, size_t numOperations) {
    MemoCache cache(makeOptions("lists"), identity);

    std::vector<Value> keys;
    keys.reserve(keyRange);
    for (size_t i = 0; i < keyRange; ++i) {
        auto n = static_cast<int64_t>(i);
        keys.push_back(Value::list({n, Value::list({n + 1, n + 2}), "tag"}));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.invoke({keys[i % keyRange]});
        }
    });

    printResult("Invoke, nested list args", timeMs, numOperations);
}

void benchmarkSharedStorage(size_t keyRange, size_t numOperations) {
    auto pool = std::make_shared<MapStorage>();
    auto options = makeOptions("a", true);
    options.storage = pool;
    MemoCache first(options, identity);
    options.name = "b";
    MemoCache second(options, identity);

    std::mt19937 rng(42);
    std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(keyRange - 1));

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            int64_t key = dist(rng);
            if (i % 2 == 0) {
                first.invoke({key});
            } else {
                second.invoke({key});
            }
        }
    });

    printResult("Two caches on shared storage", timeMs, numOperations);

    size_t removed = 0;
    double clearMs = measureMs([&]() {
        removed = first.clear();
    });
    std::cout << "  Owned-entry clear: " << removed << " entries in "
              << std::fixed << std::setprecision(2) << clearMs << " ms\n";
}

// ==================== Многопоточность ====================

void benchmarkThreads(size_t numThreads, size_t keyRange, size_t opsPerThread) {
    MemoCache cache(makeOptions("threads"), identity);

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < numThreads; ++t) {
            threads.emplace_back([&cache, t, keyRange, opsPerThread]() {
                std::mt19937 rng(static_cast<unsigned>(t));
                std::uniform_int_distribution<int64_t> dist(
                    0, static_cast<int64_t>(keyRange - 1));
                for (size_t i = 0; i < opsPerThread; ++i) {
                    cache.invoke({dist(rng)});
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    });

    printResult("Invoke, " + std::to_string(numThreads) + " thread(s)",
                timeMs, numThreads * opsPerThread);
}

// ==================== Слушатели ====================

void benchmarkListenerOverhead(size_t keyRange, size_t numOperations) {
    CacheRegistry registry;
    auto plain = registry.create(makeOptions("plain"), identity);

    auto stats = std::make_shared<StatsListener>();
    auto withStats = registry.create(makeOptions("stats"), identity);
    withStats->addListener(stats);

    double baseline = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            plain->invoke({static_cast<int64_t>(i % keyRange)});
        }
    });
    printResult("  Baseline (no listeners)", baseline, numOperations);

    double withListener = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            withStats->invoke({static_cast<int64_t>(i % keyRange)});
        }
    });
    printResult("  StatsListener", withListener, numOperations);

    std::cout << "  Hit rate: " << std::fixed << std::setprecision(1)
              << stats->hitRate() * 100 << "%\n";
}

// ==================== Main ====================

int main() {
    const size_t KEY_RANGE = 10000;
    const size_t NUM_OPS = 1000000;

    std::cout << "=== Memo Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    std::cout << "--- Basic operations ---\n";
    benchmarkMisses(NUM_OPS / 10);
    benchmarkHits(KEY_RANGE, NUM_OPS);
    benchmarkListKeys(KEY_RANGE, NUM_OPS);
    benchmarkSharedStorage(KEY_RANGE, NUM_OPS);

    std::cout << "\n--- Threads ---\n";
    for (size_t threads : {1, 2, 4, 8}) {
        benchmarkThreads(threads, KEY_RANGE, NUM_OPS / threads);
    }

    std::cout << "\n--- Listener overhead ---\n";
    benchmarkListenerOverhead(KEY_RANGE, NUM_OPS);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
