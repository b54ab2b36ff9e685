#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <utility>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Кэш, гарантирующий наличие набора обязательных ключей.
 * @details Обязательные ключи проверяются при создании и при смене набора.
 *          remove() для обязательного ключа ничего не делает, clear()
 *          удаляет только необязательные ключи. Перезапись обязательного
 *          значения через set() или update() разрешена.
 * @tparam Key Тип ключа
 * @tparam Value Тип значения
 */
template<typename Key, typename Value>
class RequiredKeysCache : public Cacheable<Key, Value> {
public:
    using KeySet = typename Cacheable<Key, Value>::KeySet;
    using Snapshot = typename Cacheable<Key, Value>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, Value>::ValueMatcher;

    /// @throws MissingRequiredKeysError если initialValues не содержит всех requiredKeys
    RequiredKeysCache(KeySet requiredKeys, Snapshot initialValues);
    /// Все начальные ключи становятся обязательными.
    explicit RequiredKeysCache(Snapshot initialValues = {});
    ~RequiredKeysCache() override = default;

    RequiredKeysCache(const RequiredKeysCache&) = delete;
    RequiredKeysCache& operator=(const RequiredKeysCache&) = delete;

    std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) override {
        return store_.fetch(key, matcher);
    }
    Value fetchRequired(const Key& key, const ValueMatcher& matcher) override {
        return store_.fetchRequired(key, matcher);
    }
    void set(const Key& key, const Value& value) override;
    void remove(const Key& key) override;
    bool contains(const Key& key) override { return store_.contains(key); }
    void clear() override;
    size_t size() const override { return store_.size(); }
    Snapshot snapshot(const ValueMatcher& matcher) const override { return store_.snapshot(matcher); }
    KeySet missingKeys(const KeySet& keys) override { return store_.missingKeys(keys); }

    KeySet requiredKeys() const;
    bool isRequired(const Key& key) const;

    /// Сменить набор обязательных ключей. При ошибке старый набор сохраняется.
    void setRequiredKeys(KeySet keys);

    /**
     * @brief resolve<T> только для обязательного ключа.
     * @throws std::invalid_argument если key не обязательный
     */
    template<typename T>
    T resolveRequired(const Key& key);

    /// Заменить обязательное значение на fn(текущее) и вернуть новое.
    template<typename T, typename Fn>
    T update(const Key& key, Fn&& fn);

    /// Вызвать fn(текущее значение) и вернуть её результат.
    template<typename T, typename Fn>
    auto use(const Key& key, Fn&& fn) -> decltype(fn(std::declval<T>()));

private:
    KeyValueStore<Key, Value> store_;
    KeySet requiredKeys_;
    mutable std::shared_mutex mutex_;
};

// Реализация шаблонного класса

template<typename Key, typename Value>
RequiredKeysCache<Key, Value>::RequiredKeysCache(KeySet requiredKeys, Snapshot initialValues)
    : store_(std::move(initialValues)), requiredKeys_(std::move(requiredKeys)) {
    auto missing = store_.missingKeys(requiredKeys_);
    if (!missing.empty()) {
        throw MissingRequiredKeysError<Key>(std::move(missing));
    }
}

template<typename Key, typename Value>
RequiredKeysCache<Key, Value>::RequiredKeysCache(Snapshot initialValues)
    : store_(std::move(initialValues)) {
    for (const auto& entry : store_.allValues()) {
        requiredKeys_.insert(entry.first);
    }
}

template<typename Key, typename Value>
void RequiredKeysCache<Key, Value>::set(const Key& key, const Value& value) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    store_.set(key, value);
}

template<typename Key, typename Value>
void RequiredKeysCache<Key, Value>::remove(const Key& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (requiredKeys_.count(key) > 0) {
        logging::logger()->debug("RequiredKeysCache: ключ '{}' обязательный, удаление пропущено", describeKey(key));
        return;
    }
    store_.remove(key);
}

template<typename Key, typename Value>
void RequiredKeysCache<Key, Value>::clear() {
    // Эксклюзивно: пока идёт очистка, набор обязательных ключей не меняется
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : store_.allValues()) {
        if (requiredKeys_.count(entry.first) == 0) {
            store_.remove(entry.first);
        }
    }
}

template<typename Key, typename Value>
typename RequiredKeysCache<Key, Value>::KeySet
RequiredKeysCache<Key, Value>::requiredKeys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return requiredKeys_;
}

template<typename Key, typename Value>
bool RequiredKeysCache<Key, Value>::isRequired(const Key& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return requiredKeys_.count(key) > 0;
}

template<typename Key, typename Value>
void RequiredKeysCache<Key, Value>::setRequiredKeys(KeySet keys) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto missing = store_.missingKeys(keys);
    if (!missing.empty()) {
        throw MissingRequiredKeysError<Key>(std::move(missing));
    }
    requiredKeys_ = std::move(keys);
}

template<typename Key, typename Value>
template<typename T>
T RequiredKeysCache<Key, Value>::resolveRequired(const Key& key) {
    if (!isRequired(key)) {
        throw std::invalid_argument("RequiredKeysCache: '" + describeKey(key) + "' is not a required key");
    }
    return this->template resolve<T>(key);
}

template<typename Key, typename Value>
template<typename T, typename Fn>
T RequiredKeysCache<Key, Value>::update(const Key& key, Fn&& fn) {
    T updated = fn(resolveRequired<T>(key));
    set(key, Value(updated));
    return updated;
}

template<typename Key, typename Value>
template<typename T, typename Fn>
auto RequiredKeysCache<Key, Value>::use(const Key& key, Fn&& fn) -> decltype(fn(std::declval<T>())) {
    return fn(resolveRequired<T>(key));
}

} // namespace cache
} // namespace core
} // namespace tiercache
