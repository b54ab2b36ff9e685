#pragma once

#include <any>
#include <cstdlib>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <variant>

#if defined(__GNUG__)
    #include <cxxabi.h>
#endif

namespace tiercache {
namespace core {
namespace cache {

namespace detail {

inline std::string demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> result(
        abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
    if (status == 0 && result) {
        return result.get();
    }
#endif
    return name;
}

template<typename T>
struct is_variant : std::false_type {};
template<typename... Ts>
struct is_variant<std::variant<Ts...>> : std::true_type {};

template<typename T, typename Variant>
struct is_variant_alternative : std::false_type {};
template<typename T, typename... Ts>
struct is_variant_alternative<T, std::variant<Ts...>> : std::disjunction<std::is_same<T, Ts>...> {};

template<typename T>
struct is_shared_ptr : std::false_type {};
template<typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T, typename = void>
struct is_streamable : std::false_type {};
template<typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

/// Человекочитаемое имя статического типа.
template<typename T>
std::string typeName() {
    return detail::demangle(typeid(T).name());
}

/**
 * @brief Имя динамического типа хранимого значения.
 * @details Для std::any и std::variant возвращает тип содержимого,
 *          для std::shared_ptr на полиморфный класс - тип объекта.
 */
template<typename Value>
std::string describeType(const Value& value) {
    if constexpr (std::is_same_v<Value, std::any>) {
        return value.has_value() ? detail::demangle(value.type().name()) : std::string("empty");
    } else if constexpr (detail::is_variant<Value>::value) {
        if (value.valueless_by_exception()) {
            return "valueless";
        }
        return std::visit([](const auto& alternative) {
            return typeName<std::decay_t<decltype(alternative)>>();
        }, value);
    } else if constexpr (detail::is_shared_ptr<Value>::value) {
        using Element = typename Value::element_type;
        if constexpr (std::is_polymorphic_v<Element>) {
            if (value) {
                return detail::demangle(typeid(*value).name());
            }
            return "nullptr";
        } else {
            return typeName<Value>();
        }
    } else {
        return typeName<Value>();
    }
}

/// Текстовое представление ключа для сообщений об ошибках и логов.
template<typename Key>
std::string describeKey(const Key& key) {
    if constexpr (std::is_convertible_v<const Key&, std::string_view>) {
        return std::string(std::string_view(key));
    } else if constexpr (std::is_arithmetic_v<Key>) {
        return std::to_string(key);
    } else if constexpr (std::is_enum_v<Key>) {
        return std::to_string(static_cast<std::underlying_type_t<Key>>(key));
    } else if constexpr (detail::is_streamable<Key>::value) {
        std::ostringstream oss;
        oss << key;
        return oss.str();
    } else {
        return "<" + typeName<Key>() + ">";
    }
}

/**
 * @brief Безопасное приведение хранимого значения к запрошенному типу.
 * @details Поддерживаются: совпадающий тип, std::any, std::variant
 *          и std::shared_ptr (dynamic_pointer_cast). Запрос std::any
 *          принимает любое значение. Неявных числовых
 *          преобразований нет: int не читается как double.
 * @tparam Output Запрашиваемый тип
 */
template<typename Output>
struct ValueCast {
    template<typename Value>
    static std::optional<Output> from(const Value& value) {
        if constexpr (std::is_same_v<Output, Value>) {
            return value;
        } else if constexpr (std::is_same_v<Output, std::any>) {
            return std::any(value);
        } else if constexpr (std::is_same_v<Value, std::any>) {
            if (const auto* result = std::any_cast<Output>(&value)) {
                return *result;
            }
            return std::nullopt;
        } else if constexpr (detail::is_variant<Value>::value) {
            if constexpr (detail::is_variant_alternative<Output, Value>::value) {
                if (const auto* result = std::get_if<Output>(&value)) {
                    return *result;
                }
            }
            return std::nullopt;
        } else if constexpr (detail::is_shared_ptr<Value>::value && detail::is_shared_ptr<Output>::value) {
            using Source = typename Value::element_type;
            using Target = typename Output::element_type;
            if constexpr (std::is_convertible_v<Source*, Target*>) {
                if (value) {
                    return Output(value);
                }
            } else if constexpr (std::is_polymorphic_v<Source>) {
                if (auto result = std::dynamic_pointer_cast<Target>(value)) {
                    return result;
                }
            }
            return std::nullopt;
        } else {
            return std::nullopt;
        }
    }

    /// Проверка совместимости без копирования значения.
    template<typename Value>
    static bool matches(const Value& value) {
        if constexpr (std::is_same_v<Output, Value> || std::is_same_v<Output, std::any>) {
            return true;
        } else if constexpr (std::is_same_v<Value, std::any>) {
            return std::any_cast<Output>(&value) != nullptr;
        } else if constexpr (detail::is_variant<Value>::value) {
            if constexpr (detail::is_variant_alternative<Output, Value>::value) {
                return std::holds_alternative<Output>(value);
            } else {
                return false;
            }
        } else {
            return from(value).has_value();
        }
    }
};

} // namespace cache
} // namespace core
} // namespace tiercache
