#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "tiercache/core/cache/base/CacheErrors.hpp"
#include "tiercache/core/cache/base/ValueCast.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс кэша для всех реализаций.
 * @details Наследники реализуют виртуальные примитивы (fetch, fetchRequired,
 *          set, remove, contains, snapshot). Типизированные операции get,
 *          resolve, require, valuesOfType построены поверх них и не виртуальны.
 *
 *          ValueMatcher — предикат над хранимым значением. Пустой matcher
 *          принимает любое значение. Предикат вызывается под блокировкой
 *          кэша и не должен обращаться к этому же кэшу.
 * @tparam Key Тип ключа (std::hash и operator==)
 * @tparam Value Тип значения (например, int или std::any)
 */
template<typename Key, typename Value>
class Cacheable {
public:
    using KeyType = Key;
    using DataType = Value;
    using KeySet = std::unordered_set<Key>;
    using Snapshot = std::unordered_map<Key, Value>;
    using ValueMatcher = std::function<bool(const Value&)>;

    virtual ~Cacheable() = default;

    /// Найти значение, подходящее под matcher. Промах и несовпадение типа дают std::nullopt.
    virtual std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) = 0;

    /**
     * @brief Найти значение или бросить ошибку отсутствия.
     * @details Реализация обязана выполнить ровно один поиск под одной
     *          блокировкой. matcher — подсказка для составных кэшей: значение
     *          возвращается, даже если matcher его отверг.
     * @throws MissingRequiredKeysError если ключа нет
     */
    virtual Value fetchRequired(const Key& key, const ValueMatcher& matcher) {
        (void)matcher;
        if (auto value = fetch(key, ValueMatcher{})) {
            return std::move(*value);
        }
        throw MissingRequiredKeysError<Key>(KeySet{key});
    }

    /// Сохранить значение по ключу (upsert).
    virtual void set(const Key& key, const Value& value) = 0;
    /// Удалить значение по ключу. Отсутствующий ключ — не ошибка.
    virtual void remove(const Key& key) = 0;
    /// Есть ли ключ в кэше.
    virtual bool contains(const Key& key) = 0;
    /// Очистить кэш полностью.
    virtual void clear() = 0;
    /// Получить количество элементов в кэше.
    virtual size_t size() const = 0;

    /// Снимок содержимого, отфильтрованный matcher.
    virtual Snapshot snapshot(const ValueMatcher& matcher) const = 0;

    /// Подмножество keys, которого нет в кэше.
    virtual KeySet missingKeys(const KeySet& keys) {
        KeySet missing;
        for (const auto& key : keys) {
            if (!contains(key)) {
                missing.insert(key);
            }
        }
        return missing;
    }

    /// Значение, приведённое к Output, либо std::nullopt.
    template<typename Output = Value>
    std::optional<Output> get(const Key& key) {
        auto value = fetch(key, matcherFor<Output>());
        if (!value) {
            return std::nullopt;
        }
        return ValueCast<Output>::from(*value);
    }

    /**
     * @brief Значение, приведённое к Output.
     * @throws MissingRequiredKeysError если ключа нет
     * @throws InvalidTypeError если значение другого типа
     * @throws ExpiredValueError для кэшей с истечением срока
     */
    template<typename Output = Value>
    Output resolve(const Key& key) {
        Value value = fetchRequired(key, matcherFor<Output>());
        auto output = ValueCast<Output>::from(value);
        if (!output) {
            throw InvalidTypeError(typeName<Output>(), describeType(value));
        }
        return std::move(*output);
    }

    /// Проверить наличие ключа; возвращает сам кэш для цепочки вызовов.
    Cacheable& require(const Key& key) {
        return requireKeys(KeySet{key});
    }

    /// Проверить наличие всех ключей; ошибка перечисляет все отсутствующие.
    Cacheable& requireKeys(const KeySet& keys) {
        auto missing = missingKeys(keys);
        if (!missing.empty()) {
            throw MissingRequiredKeysError<Key>(std::move(missing));
        }
        return *this;
    }

    /// Снимок записей, значения которых приводятся к Output.
    template<typename Output = Value>
    std::unordered_map<Key, Output> valuesOfType() const {
        std::unordered_map<Key, Output> result;
        for (const auto& [key, value] : snapshot(matcherFor<Output>())) {
            if (auto output = ValueCast<Output>::from(value)) {
                result.emplace(key, std::move(*output));
            }
        }
        return result;
    }

    /// Все записи кэша.
    Snapshot allValues() const {
        return snapshot(ValueMatcher{});
    }

    template<typename Output>
    static ValueMatcher matcherFor() {
        if constexpr (std::is_same_v<Output, Value>) {
            return ValueMatcher{};
        } else {
            return [](const Value& value) { return ValueCast<Output>::matches(value); };
        }
    }
};

} // namespace cache
} // namespace core
} // namespace tiercache
