#pragma once

#include <algorithm>
#include <any>
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "tiercache/core/cache/base/Cacheable.hpp"

namespace tiercache {
namespace core {
namespace cache {

enum class ChangeKind {
    Set,
    Removed,
    Cleared
};

// Уведомление об изменении содержимого хранилища
template<typename Key, typename Value>
struct CacheChange {
    ChangeKind kind;
    std::optional<Key> key;     // Пусто для Cleared
    std::optional<Value> value; // Новое значение для Set, удалённое для Removed
};

/**
 * @brief Потокобезопасное хранилище ключ-значение без политик вытеснения.
 * @details Основа всех остальных вариантов кэша: LRU, истекающий,
 *          сохраняемый и кэш обязательных ключей владеют экземпляром
 *          KeyValueStore и добавляют свою политику поверх него.
 *
 *          Чтение — под shared_lock, запись — под unique_lock. Блокировка
 *          не рекурсивная: ни одна операция не вызывает другую блокирующую
 *          операцию этого же экземпляра. Наблюдатели вызываются в потоке,
 *          выполнившем изменение, после снятия блокировки, поэтому из
 *          обработчика можно снова обращаться к хранилищу.
 * @tparam Key Тип ключа
 * @tparam Value Тип значения
 */
template<typename Key, typename Value>
class KeyValueStore : public Cacheable<Key, Value> {
public:
    using KeySet = typename Cacheable<Key, Value>::KeySet;
    using Snapshot = typename Cacheable<Key, Value>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, Value>::ValueMatcher;
    using Change = CacheChange<Key, Value>;
    using Observer = std::function<void(const Change&)>;
    using SubscriptionId = size_t;

    explicit KeyValueStore(Snapshot initialValues = {});
    ~KeyValueStore() override = default;

    KeyValueStore(const KeyValueStore&) = delete;
    KeyValueStore& operator=(const KeyValueStore&) = delete;

    std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) override;
    Value fetchRequired(const Key& key, const ValueMatcher& matcher) override;
    void set(const Key& key, const Value& value) override;
    void remove(const Key& key) override;
    bool contains(const Key& key) override;
    void clear() override;
    size_t size() const override;
    Snapshot snapshot(const ValueMatcher& matcher) const override;
    KeySet missingKeys(const KeySet& keys) override;

    /// Удалить ключ и вернуть удалённое значение.
    std::optional<Value> extract(const Key& key);

    /// Атомарно удалить ключ, если его значение удовлетворяет predicate.
    std::optional<Value> removeIf(const Key& key, const ValueMatcher& predicate);

    /// Подписаться на изменения. Возвращает идентификатор для unsubscribe.
    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

private:
    void publish(const Change& change) const;

    Snapshot cache_;
    mutable std::shared_mutex mutex_;

    std::vector<std::pair<SubscriptionId, Observer>> observers_;
    mutable std::mutex observersMutex_;
    SubscriptionId nextSubscriptionId_ = 1;
    std::atomic<bool> hasObservers_{false};
};

// Алиас для хранилища разнотипных значений
using DefaultKeyValueStore = KeyValueStore<std::string, std::any>;

// Реализация шаблонного класса

template<typename Key, typename Value>
KeyValueStore<Key, Value>::KeyValueStore(Snapshot initialValues)
    : cache_(std::move(initialValues)) {}

template<typename Key, typename Value>
std::optional<Value> KeyValueStore<Key, Value>::fetch(const Key& key, const ValueMatcher& matcher) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (matcher && !matcher(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

template<typename Key, typename Value>
Value KeyValueStore<Key, Value>::fetchRequired(const Key& key, const ValueMatcher& matcher) {
    (void)matcher;
    // Один поиск под одной блокировкой: отсутствие и несовпадение типа
    // различаются по одному и тому же снимку
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        throw MissingRequiredKeysError<Key>(KeySet{key});
    }
    return it->second;
}

template<typename Key, typename Value>
void KeyValueStore<Key, Value>::set(const Key& key, const Value& value) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cache_.insert_or_assign(key, value);
    }
    if (hasObservers_.load(std::memory_order_acquire)) {
        publish(Change{ChangeKind::Set, key, value});
    }
}

template<typename Key, typename Value>
void KeyValueStore<Key, Value>::remove(const Key& key) {
    extract(key);
}

template<typename Key, typename Value>
std::optional<Value> KeyValueStore<Key, Value>::extract(const Key& key) {
    std::optional<Value> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end()) {
            return std::nullopt;
        }
        removed = std::move(it->second);
        cache_.erase(it);
    }
    if (hasObservers_.load(std::memory_order_acquire)) {
        publish(Change{ChangeKind::Removed, key, removed});
    }
    return removed;
}

template<typename Key, typename Value>
std::optional<Value> KeyValueStore<Key, Value>::removeIf(const Key& key, const ValueMatcher& predicate) {
    std::optional<Value> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end() || (predicate && !predicate(it->second))) {
            return std::nullopt;
        }
        removed = std::move(it->second);
        cache_.erase(it);
    }
    if (hasObservers_.load(std::memory_order_acquire)) {
        publish(Change{ChangeKind::Removed, key, removed});
    }
    return removed;
}

template<typename Key, typename Value>
bool KeyValueStore<Key, Value>::contains(const Key& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.find(key) != cache_.end();
}

template<typename Key, typename Value>
void KeyValueStore<Key, Value>::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        cache_.clear();
    }
    if (hasObservers_.load(std::memory_order_acquire)) {
        publish(Change{ChangeKind::Cleared, std::nullopt, std::nullopt});
    }
}

template<typename Key, typename Value>
size_t KeyValueStore<Key, Value>::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

template<typename Key, typename Value>
typename KeyValueStore<Key, Value>::Snapshot
KeyValueStore<Key, Value>::snapshot(const ValueMatcher& matcher) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!matcher) {
        return cache_;
    }
    Snapshot result;
    for (const auto& [key, value] : cache_) {
        if (matcher(value)) {
            result.emplace(key, value);
        }
    }
    return result;
}

template<typename Key, typename Value>
typename KeyValueStore<Key, Value>::KeySet
KeyValueStore<Key, Value>::missingKeys(const KeySet& keys) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    KeySet missing;
    for (const auto& key : keys) {
        if (cache_.find(key) == cache_.end()) {
            missing.insert(key);
        }
    }
    return missing;
}

template<typename Key, typename Value>
typename KeyValueStore<Key, Value>::SubscriptionId
KeyValueStore<Key, Value>::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    auto id = nextSubscriptionId_++;
    observers_.emplace_back(id, std::move(observer));
    hasObservers_.store(true, std::memory_order_release);
    return id;
}

template<typename Key, typename Value>
void KeyValueStore<Key, Value>::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [id](const auto& entry) { return entry.first == id; }),
                     observers_.end());
    hasObservers_.store(!observers_.empty(), std::memory_order_release);
}

template<typename Key, typename Value>
void KeyValueStore<Key, Value>::publish(const Change& change) const {
    // Копия списка: обработчик может подписываться и отписываться
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(change);
    }
}

} // namespace cache
} // namespace core
} // namespace tiercache
