#pragma once

#include <cmath>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Символ — интернированное имя (сравнивается по имени)
 *
 * Отличается от строки только типом: Value::symbol("x") != Value("x").
 */
struct Symbol {
    std::string name;

    bool operator==(const Symbol& other) const { return name == other.name; }
    bool operator!=(const Symbol& other) const { return !(*this == other); }
};

/**
 * @brief Динамически типизированное значение аргумента или результата
 *
 * Варианты:
 * - Nil     — пустое значение (канонический маркер "ничего")
 * - bool, int64_t, double, std::string
 * - Symbol  — интернированное имя
 * - List    — упорядоченная последовательность значений (рекурсивно)
 *
 * Равенство и хэш структурные: два разных списка с равными элементами
 * в одинаковом порядке равны и имеют одинаковый хэш.
 *
 * @code
 *   Value args = Value::list({2, 3});
 *   Value nested = Value::list({Value::symbol("point"), Value::list({1.5, 2.5})});
 * @endcode
 */
class Value {
public:
    struct Nil {
        bool operator==(const Nil&) const { return true; }
        bool operator!=(const Nil&) const { return false; }
    };

    using List = std::vector<Value>;
    using Storage = std::variant<Nil, bool, int64_t, double, std::string, Symbol, List>;

    Value() : data_(std::in_place_type<Nil>) {}
    Value(Nil) : data_(std::in_place_type<Nil>) {}
    Value(bool b) : data_(std::in_place_type<bool>, b) {}
    Value(const char* s) : data_(std::in_place_type<std::string>, s) {}
    Value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}
    Value(Symbol s) : data_(std::in_place_type<Symbol>, std::move(s)) {}
    Value(List items) : data_(std::in_place_type<List>, std::move(items)) {}
    Value(double d) : data_(std::in_place_type<double>, d) {}

    /// Любой целочисленный тип (кроме bool) хранится как int64_t
    template<typename T,
             typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
    Value(T n) : data_(std::in_place_type<int64_t>, static_cast<int64_t>(n)) {}

    static Value nil() { return Value(); }
    static Value symbol(std::string name) { return Value(Symbol{std::move(name)}); }
    static Value list(std::initializer_list<Value> items) { return Value(List(items)); }
    static Value list(List items) { return Value(std::move(items)); }

    // ==================== Проверки типа ====================

    bool isNil() const { return std::holds_alternative<Nil>(data_); }
    bool isBool() const { return std::holds_alternative<bool>(data_); }
    bool isInt() const { return std::holds_alternative<int64_t>(data_); }
    bool isDouble() const { return std::holds_alternative<double>(data_); }
    bool isString() const { return std::holds_alternative<std::string>(data_); }
    bool isSymbol() const { return std::holds_alternative<Symbol>(data_); }
    bool isList() const { return std::holds_alternative<List>(data_); }

    // ==================== Доступ ====================
    // Бросают std::bad_variant_access при несовпадении типа

    bool asBool() const { return std::get<bool>(data_); }
    int64_t asInt() const { return std::get<int64_t>(data_); }
    double asDouble() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }
    const Symbol& asSymbol() const { return std::get<Symbol>(data_); }
    const List& asList() const { return std::get<List>(data_); }

    const Storage& storage() const { return data_; }

    /// Списки сравниваются поэлементно этим же оператором; NaN == NaN
    bool operator==(const Value& other) const {
        if (isDouble() && other.isDouble()) {
            double a = asDouble();
            double b = other.asDouble();
            return a == b || (std::isnan(a) && std::isnan(b));
        }
        return data_ == other.data_;
    }
    bool operator!=(const Value& other) const { return !(*this == other); }

    /**
     * @brief Структурный хэш
     *
     * Для списков комбинирует хэши элементов в порядке следования,
     * поэтому [1, 2] и [2, 1] (почти всегда) дают разные хэши.
     * Индекс варианта подмешивается, чтобы 1 и "1" не совпадали.
     * Все NaN дают один хэш (согласовано с operator==).
     */
    size_t hash() const {
        size_t seed = data_.index();
        std::visit([&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Nil>) {
                combine(seed, 0);
            } else if constexpr (std::is_same_v<T, Symbol>) {
                combine(seed, std::hash<std::string>{}(v.name));
            } else if constexpr (std::is_same_v<T, List>) {
                combine(seed, v.size());
                for (const auto& item : v) {
                    combine(seed, item.hash());
                }
            } else if constexpr (std::is_same_v<T, double>) {
                combine(seed, std::isnan(v) ? 0x7ff8ULL : std::hash<double>{}(v));
            } else {
                combine(seed, std::hash<T>{}(v));
            }
        }, data_);
        return seed;
    }

private:
    static void combine(size_t& seed, size_t h) {
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

    Storage data_;
};

/// Кортеж аргументов или последовательность результатов
using Values = std::vector<Value>;

/**
 * @brief Вывод в лисп-подобной нотации: nil, 42, "s", sym, (1 2 3)
 */
inline std::ostream& operator<<(std::ostream& os, const Value& value) {
    std::visit([&os](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Value::Nil>) {
            os << "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
            os << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
            os << '"' << v << '"';
        } else if constexpr (std::is_same_v<T, Symbol>) {
            os << v.name;
        } else if constexpr (std::is_same_v<T, Value::List>) {
            os << '(';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) os << ' ';
                os << v[i];
            }
            os << ')';
        } else {
            os << v;
        }
    }, value.storage());
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const Values& values) {
    return os << Value(Value::List(values));
}

namespace std {
template<>
struct hash<Value> {
    size_t operator()(const Value& value) const { return value.hash(); }
};
}
