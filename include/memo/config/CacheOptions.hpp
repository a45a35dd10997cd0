#pragma once

#include <memo/expiration/IExpirationPolicy.hpp>
#include <memo/listeners/ICacheListener.hpp>
#include <memo/storage/IStorage.hpp>
#include <memo/storage/MapStorage.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Вид хранилища кэша (фиксируется при создании)
 */
enum class StorageKind {
    SingleSlot,  ///< Одна запись, аргументы не учитываются
    Map          ///< Словарь по канонизированным аргументам
};

inline const char* toString(StorageKind kind) {
    switch (kind) {
        case StorageKind::SingleSlot: return "single-slot";
        case StorageKind::Map:        return "map";
    }
    return "unknown";
}

/**
 * @brief Разбор вида хранилища из строки конфигурации
 * @throws std::invalid_argument для неизвестного вида
 */
inline StorageKind parseStorageKind(const std::string& text) {
    if (text == "single-slot" || text == "single") {
        return StorageKind::SingleSlot;
    }
    if (text == "map" || text == "hash") {
        return StorageKind::Map;
    }
    throw std::invalid_argument("Unknown storage kind: '" + text + "'");
}

/**
 * @brief Параметры создания кэша
 *
 * @code
 *   CacheOptions options;
 *   options.name = "math::sumOf";
 *   options.timeout = std::chrono::seconds(30);
 *   options.kind = StorageKind::Map;
 *   options.arity = 2;
 * @endcode
 *
 * Ошибки конфигурации обнаруживаются в validate() — при создании кэша,
 * а не при первом вызове.
 */
struct CacheOptions {
    using Duration = IExpirationPolicy::Duration;
    using StorageFactory = std::function<std::shared_ptr<IStorage>()>;

    /// Уникальное имя; часть до последнего "::" — пространство имён
    std::string name;

    /// Время жизни записи, nullopt — без истечения
    std::optional<Duration> timeout;

    StorageKind kind = StorageKind::Map;

    /// Хранилище разделяется с другими кэшами, ключи получают префикс-имя
    bool sharedResults = false;

    /// Явное общее хранилище; если пусто — берётся общее хранилище реестра
    std::shared_ptr<MapStorage> storage;

    /// Фабрика хранилища (только Map без sharedResults); nullptr от фабрики
    /// переводит кэш в режим "всегда вычислять"
    StorageFactory storageFactory;

    /// Ожидаемое число аргументов, nullopt — произвольное
    std::optional<size_t> arity;

    std::vector<std::shared_ptr<ICacheListener>> listeners;

    /**
     * @throws std::invalid_argument при противоречивых параметрах
     */
    void validate() const {
        if (name.empty()) {
            throw std::invalid_argument("Cache name cannot be empty");
        }
        if (kind != StorageKind::SingleSlot && kind != StorageKind::Map) {
            throw std::invalid_argument("Cache '" + name + "': unknown storage kind");
        }
        if (timeout && *timeout <= Duration::zero()) {
            throw std::invalid_argument("Cache '" + name + "': timeout must be positive");
        }
        if (kind == StorageKind::SingleSlot) {
            if (sharedResults) {
                throw std::invalid_argument(
                    "Cache '" + name + "': single-slot storage cannot be shared");
            }
            if (storage || storageFactory) {
                throw std::invalid_argument(
                    "Cache '" + name + "': single-slot storage cannot be supplied externally");
            }
        }
        if (storage && !sharedResults) {
            throw std::invalid_argument(
                "Cache '" + name + "': explicit storage requires sharedResults");
        }
        if (storageFactory && sharedResults) {
            throw std::invalid_argument(
                "Cache '" + name + "': storage factory cannot be used with sharedResults");
        }
        for (const auto& listener : listeners) {
            if (!listener) {
                throw std::invalid_argument("Cache '" + name + "': listener cannot be null");
            }
        }
    }
};

/**
 * @brief Пространство имён кэша: всё до последнего "::"
 *
 * "geo::area" → "geo", "a::b::f" → "a::b", "f" → ""
 */
inline std::string namespaceOf(const std::string& name) {
    auto pos = name.rfind("::");
    if (pos == std::string::npos) {
        return {};
    }
    return name.substr(0, pos);
}
