#pragma once

#include <memo/config/CacheOptions.hpp>
#include <memo/expiration/FixedTimeout.hpp>
#include <memo/expiration/IExpirationPolicy.hpp>
#include <memo/expiration/NoExpiration.hpp>
#include <memo/key/KeyDerivation.hpp>
#include <memo/listeners/ICacheListener.hpp>
#include <memo/storage/IStorage.hpp>
#include <memo/storage/MapStorage.hpp>
#include <memo/storage/SingleSlotStorage.hpp>
#include <algorithm>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Мемоизированная функция: кэш результатов по аргументам
 *
 * Архитектура:
 * - Хранилище (IStorage) выбирается при создании и не меняется:
 *   SingleSlotStorage или MapStorage (Strategy pattern)
 * - Политика истечения — NoExpiration или FixedTimeout
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Алгоритм invoke(args):
 * 1. key = ключ аргументов (для single-slot — пустой)
 * 2. entry = storage.get(key)
 * 3. записи нет или она устарела → вычислить, записать, вернуть
 * 4. иначе вернуть сохранённые значения (время записи не обновляется)
 *
 * Шаги 2-3 не атомарны: при одновременном промахе по одному ключу
 * функцию вычислят оба потока, в хранилище останется последняя запись
 * (last-write-wins). Однократное вычисление не гарантируется.
 *
 * Исключение из функции пробрасывается вызывающему без изменений,
 * хранилище при этом не трогается.
 *
 * @code
 *   CacheOptions options;
 *   options.name = "sumOf";
 *   MemoCache sumOf(options, [](const Values& args) {
 *       return Values{args[0].asInt() + args[1].asInt()};
 *   });
 *   sumOf.invoke({2, 3});  // {5}, функция вызвана
 *   sumOf.invoke({2, 3});  // {5}, из кэша
 * @endcode
 */
class MemoCache {
public:
    using Function = std::function<Values(const Values&)>;
    using Clock = IExpirationPolicy::Clock;
    using TimePoint = IExpirationPolicy::TimePoint;
    using Duration = IExpirationPolicy::Duration;

    /**
     * @brief Конструктор с собственным хранилищем
     *
     * Для sharedResults без явного options.storage создаётся отдельный
     * MapStorage; общее хранилище реестра подставляет CacheRegistry.
     *
     * @throws std::invalid_argument при ошибке конфигурации
     */
    MemoCache(CacheOptions options, Function function)
        : MemoCache(options, std::move(function), materializeStorage(options, nullptr))
    {}

    /**
     * @brief Конструктор с готовым хранилищем
     * @param storage Хранилище; nullptr — кэш всегда вычисляет (fail-open)
     */
    MemoCache(CacheOptions options, Function function, std::shared_ptr<IStorage> storage)
        : name_(validated(options).name)
        , kind_(options.kind)
        , shared_(options.sharedResults)
        , arity_(options.arity)
        , function_(std::move(function))
        , storage_(std::move(storage))
        , listeners_(std::move(options.listeners))
    {
        if (!function_) {
            throw std::invalid_argument("Cache '" + name_ + "': function cannot be null");
        }

        if (options.timeout) {
            expirationPolicy_ = std::make_unique<FixedTimeout>(*options.timeout);
        } else {
            expirationPolicy_ = std::make_unique<NoExpiration>();
        }

        if (!storage_) {
            notifyStorageUnavailable();
        }
    }

    /**
     * @brief Создать хранилище по параметрам
     * @param options Параметры кэша (уже провалидированные или нет)
     * @param sharedDefault Общее хранилище для sharedResults без options.storage
     * @return Хранилище; nullptr, если фабрика его не создала
     */
    static std::shared_ptr<IStorage> materializeStorage(const CacheOptions& options,
                                                        std::shared_ptr<MapStorage> sharedDefault) {
        switch (options.kind) {
            case StorageKind::SingleSlot:
                return std::make_shared<SingleSlotStorage>();
            case StorageKind::Map:
                if (options.sharedResults) {
                    if (options.storage) return options.storage;
                    if (sharedDefault) return sharedDefault;
                    return std::make_shared<MapStorage>();
                }
                if (options.storageFactory) {
                    return options.storageFactory();
                }
                return std::make_shared<MapStorage>();
        }
        throw std::invalid_argument("Cache '" + options.name + "': unknown storage kind");
    }

    // ==================== Вызов ====================

    /**
     * @brief Вернуть результат из кэша или вычислить его
     * @param args Аргументы вызова
     * @return Полная последовательность результатов
     * @throws std::invalid_argument если число аргументов не совпадает с arity
     * @throws любое исключение вычисляемой функции
     */
    Values invoke(const Values& args) {
        checkArity(args);
        CacheKey key = keyFor(args);

        std::optional<CacheEntry> cached;
        if (storage_) {
            cached = storage_->get(key);
        }

        std::optional<TimePoint> storedAt;
        if (cached) {
            storedAt = cached->storedAt;
        }

        if (!expirationPolicy_->isExpired(storedAt, Clock::now())) {
            notifyHit(key);
            return std::move(cached->values);
        }

        if (cached) {
            notifyExpire(key);
        }
        notifyMiss(key);

        Values result = compute(key, args);
        if (storage_) {
            storage_->set(key, result);
            notifyStore(key, result);
        }
        return result;
    }

    /**
     * @brief Основное (первое) значение результата, nil если результатов нет
     */
    Value invokeOne(const Values& args) {
        Values result = invoke(args);
        if (result.empty()) {
            return Value::nil();
        }
        return std::move(result.front());
    }

    /**
     * @brief Вызов с произвольными аргументами, приводимыми к Value
     *
     * @code
     *   sumOf(2, 3);  // то же, что sumOf.invoke({2, 3})
     * @endcode
     */
    template<typename... Args>
    Values operator()(Args&&... args) {
        return invoke(Values{Value(std::forward<Args>(args))...});
    }

    // ==================== Инвалидация ====================

    /**
     * @brief Удалить запись для конкретных аргументов
     * @return Количество удалённых записей (0 или 1)
     *
     * Для single-slot всегда сбрасывает единственный слот.
     * Отсутствующая запись — не ошибка.
     */
    size_t clear(const Values& args) {
        if (!storage_) {
            return 0;
        }

        CacheKey key = keyFor(args);
        if (!storage_->remove(key)) {
            return 0;
        }
        notifyRemove(key);
        return 1;
    }

    /**
     * @brief Удалить все записи этого кэша
     * @return Количество удалённых записей
     *
     * - single-slot, собственный словарь — очищается целиком
     * - общий словарь — удаляются только записи с owner == name(),
     *   записи соседних кэшей остаются
     */
    size_t clear() {
        if (!storage_) {
            return 0;
        }

        size_t count = 0;
        if (shared_) {
            const std::string& owner = name_;
            count = storage_->removeIf([&owner](const CacheKey& key) {
                return key.isOwnedBy(owner);
            });
        } else {
            count = storage_->clear();
        }

        notifyClear(count);
        return count;
    }

    // ==================== Интроспекция ====================

    /**
     * @brief Посмотреть запись без вычисления и без уведомлений
     * @return Запись (возможно устаревшая) или nullopt
     */
    std::optional<CacheEntry> peek(const Values& args) const {
        if (!storage_) {
            return std::nullopt;
        }
        return storage_->get(keyFor(args));
    }

    /**
     * @brief Оставшееся время жизни записи
     * @return nullopt — бесконечно или записи нет
     */
    std::optional<Duration> timeToLive(const Values& args) const {
        auto entry = peek(args);
        if (!entry) {
            return std::nullopt;
        }
        return expirationPolicy_->timeToLive(entry->storedAt, Clock::now());
    }

    /**
     * @brief Ключ, под которым хранится результат для этих аргументов
     */
    CacheKey keyFor(const Values& args) const {
        if (kind_ == StorageKind::SingleSlot) {
            return CacheKey{};
        }
        return deriveKey(args, shared_ ? name_ : std::string());
    }

    const std::string& name() const { return name_; }
    StorageKind kind() const { return kind_; }
    bool isShared() const { return shared_; }
    std::optional<size_t> arity() const { return arity_; }
    std::optional<Duration> timeout() const { return expirationPolicy_->timeout(); }

    /// false — хранилище не создано, результаты не кэшируются
    bool hasStorage() const { return storage_ != nullptr; }

    /**
     * @brief Хранилище кэша (для общих — одно на несколько кэшей)
     */
    std::shared_ptr<IStorage> storage() const { return storage_; }

    // ==================== Управление слушателями ====================

    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (!listener) {
            return;
        }
        {
            std::unique_lock lock(listenersMutex_);
            listeners_.push_back(listener);
        }
        if (!storage_) {
            listener->onStorageUnavailable(name_);
        }
    }

    void removeListener(const std::shared_ptr<ICacheListener>& listener) {
        std::unique_lock lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    static const CacheOptions& validated(const CacheOptions& options) {
        options.validate();
        return options;
    }

    void checkArity(const Values& args) const {
        if (arity_ && args.size() != *arity_) {
            throw std::invalid_argument(
                "Cache '" + name_ + "': expected " + std::to_string(*arity_) +
                " argument(s), got " + std::to_string(args.size()));
        }
    }

    Values compute(const CacheKey& key, const Values& args) {
        try {
            return function_(args);
        } catch (const std::exception& e) {
            notifyError(key, e.what());
            throw;
        }
    }

    // ==================== Уведомления слушателей ====================

    /// Слушатели вызываются по снимку, без блокировки: из колбэка можно
    /// обращаться к кэшу и реестру (в том числе add/removeListener)
    template<typename Notify>
    void notifyAll(Notify&& notify) {
        std::vector<std::shared_ptr<ICacheListener>> snapshot;
        {
            std::shared_lock lock(listenersMutex_);
            snapshot = listeners_;
        }
        for (auto& listener : snapshot) {
            notify(*listener);
        }
    }

    void notifyHit(const CacheKey& key) {
        notifyAll([&](ICacheListener& l) { l.onHit(name_, key); });
    }

    void notifyMiss(const CacheKey& key) {
        notifyAll([&](ICacheListener& l) { l.onMiss(name_, key); });
    }

    void notifyExpire(const CacheKey& key) {
        notifyAll([&](ICacheListener& l) { l.onExpire(name_, key); });
    }

    void notifyStore(const CacheKey& key, const Values& values) {
        notifyAll([&](ICacheListener& l) { l.onStore(name_, key, values); });
    }

    void notifyRemove(const CacheKey& key) {
        notifyAll([&](ICacheListener& l) { l.onRemove(name_, key); });
    }

    void notifyClear(size_t count) {
        notifyAll([&](ICacheListener& l) { l.onClear(name_, count); });
    }

    void notifyError(const CacheKey& key, const std::string& what) {
        notifyAll([&](ICacheListener& l) { l.onError(name_, key, what); });
    }

    void notifyStorageUnavailable() {
        notifyAll([&](ICacheListener& l) { l.onStorageUnavailable(name_); });
    }

private:
    std::string name_;
    StorageKind kind_;
    bool shared_;
    std::optional<size_t> arity_;
    Function function_;
    std::shared_ptr<IStorage> storage_;
    std::unique_ptr<IExpirationPolicy> expirationPolicy_;
    std::vector<std::shared_ptr<ICacheListener>> listeners_;
    mutable std::shared_mutex listenersMutex_;
};

/// Дескриптор кэша, выдаваемый реестром
using CacheHandle = std::shared_ptr<MemoCache>;
