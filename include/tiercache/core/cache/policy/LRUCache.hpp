#pragma once

#include <cstddef>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Кэш с вытеснением давно не используемых записей (LRU).
 * @details Хранит значения во внутреннем KeyValueStore и ведёт список
 *          ключей по давности использования: в голове — самый старый,
 *          в хвосте — самый свежий. Успешные get, set, contains и resolve
 *          переносят ключ в хвост. Когда записей больше capacity,
 *          вытесняется голова списка.
 *
 *          Вся последовательность "изменить хранилище + изменить список"
 *          выполняется под собственным мьютексом кэша. Порядок блокировок
 *          всегда один: мьютекс LRU, затем мьютекс хранилища.
 * @tparam Key Тип ключа
 * @tparam Value Тип значения
 */
template<typename Key, typename Value>
class LRUCache : public Cacheable<Key, Value> {
public:
    using KeySet = typename Cacheable<Key, Value>::KeySet;
    using Snapshot = typename Cacheable<Key, Value>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, Value>::ValueMatcher;
    using EvictionCallback = std::function<void(const Key&, const Value&)>;

    /// capacity == 0: каждая запись вытесняется сразу после вставки.
    explicit LRUCache(size_t capacity, Snapshot initialValues = {});
    /// Ёмкость равна количеству начальных значений.
    explicit LRUCache(Snapshot initialValues);
    ~LRUCache() override = default;

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) override;
    Value fetchRequired(const Key& key, const ValueMatcher& matcher) override;
    void set(const Key& key, const Value& value) override;
    void remove(const Key& key) override;
    bool contains(const Key& key) override;
    void clear() override;
    size_t size() const override;
    Snapshot snapshot(const ValueMatcher& matcher) const override;
    KeySet missingKeys(const KeySet& keys) override;

    size_t capacity() const { return capacity_; }

    /// Callback вытеснения по ёмкости; вызывается после снятия блокировок.
    void setEvictionCallback(EvictionCallback cb);

    /// Ключи от самого старого к самому свежему.
    std::list<Key> recencyOrder() const;

    CacheMetrics getMetrics() const;

private:
    void touch(const Key& key);
    std::optional<std::pair<Key, Value>> evictOldest();

    const size_t capacity_;
    KeyValueStore<Key, Value> store_;
    std::list<Key> recency_;
    std::unordered_map<Key, typename std::list<Key>::iterator> positions_;
    mutable std::mutex mutex_;
    EvictionCallback evictionCallback_;
    CacheCounters counters_;
};

// Реализация шаблонного класса

template<typename Key, typename Value>
LRUCache<Key, Value>::LRUCache(size_t capacity, Snapshot initialValues)
    : capacity_(capacity), store_(std::move(initialValues)) {
    for (const auto& entry : store_.allValues()) {
        touch(entry.first);
    }
    while (recency_.size() > capacity_) {
        evictOldest();
    }
}

template<typename Key, typename Value>
LRUCache<Key, Value>::LRUCache(Snapshot initialValues)
    : LRUCache(initialValues.size(), initialValues) {}

template<typename Key, typename Value>
std::optional<Value> LRUCache<Key, Value>::fetch(const Key& key, const ValueMatcher& matcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = store_.fetch(key, matcher);
    counters_.recordLookup(value.has_value());
    if (value) {
        touch(key);
    }
    return value;
}

template<typename Key, typename Value>
Value LRUCache<Key, Value>::fetchRequired(const Key& key, const ValueMatcher& matcher) {
    (void)matcher;
    std::lock_guard<std::mutex> lock(mutex_);
    auto value = store_.fetch(key, ValueMatcher{});
    counters_.recordLookup(value.has_value());
    if (!value) {
        throw MissingRequiredKeysError<Key>(KeySet{key});
    }
    touch(key);
    return std::move(*value);
}

template<typename Key, typename Value>
void LRUCache<Key, Value>::set(const Key& key, const Value& value) {
    std::optional<std::pair<Key, Value>> evicted;
    EvictionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.set(key, value);
        touch(key);
        if (recency_.size() > capacity_) {
            evicted = evictOldest();
            callback = evictionCallback_;
        }
    }
    if (evicted && callback) {
        callback(evicted->first, evicted->second);
    }
}

template<typename Key, typename Value>
void LRUCache<Key, Value>::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.remove(key);
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        recency_.erase(it->second);
        positions_.erase(it);
    }
}

template<typename Key, typename Value>
bool LRUCache<Key, Value>::contains(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_.contains(key)) {
        return false;
    }
    touch(key);
    return true;
}

template<typename Key, typename Value>
void LRUCache<Key, Value>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear();
    recency_.clear();
    positions_.clear();
}

template<typename Key, typename Value>
size_t LRUCache<Key, Value>::size() const {
    return store_.size();
}

template<typename Key, typename Value>
typename LRUCache<Key, Value>::Snapshot
LRUCache<Key, Value>::snapshot(const ValueMatcher& matcher) const {
    // Снимок не считается обращением и порядок не меняет
    return store_.snapshot(matcher);
}

template<typename Key, typename Value>
typename LRUCache<Key, Value>::KeySet
LRUCache<Key, Value>::missingKeys(const KeySet& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    KeySet missing;
    for (const auto& key : keys) {
        if (store_.contains(key)) {
            touch(key);
        } else {
            missing.insert(key);
        }
    }
    return missing;
}

template<typename Key, typename Value>
void LRUCache<Key, Value>::setEvictionCallback(EvictionCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    evictionCallback_ = std::move(cb);
}

template<typename Key, typename Value>
std::list<Key> LRUCache<Key, Value>::recencyOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recency_;
}

template<typename Key, typename Value>
CacheMetrics LRUCache<Key, Value>::getMetrics() const {
    return counters_.toMetrics(store_.size(), capacity_);
}

template<typename Key, typename Value>
void LRUCache<Key, Value>::touch(const Key& key) {
    auto it = positions_.find(key);
    if (it != positions_.end()) {
        recency_.splice(recency_.end(), recency_, it->second);
    } else {
        positions_.emplace(key, recency_.insert(recency_.end(), key));
    }
}

template<typename Key, typename Value>
std::optional<std::pair<Key, Value>> LRUCache<Key, Value>::evictOldest() {
    if (recency_.empty()) {
        return std::nullopt;
    }

    Key oldest = recency_.front();
    positions_.erase(oldest);
    recency_.pop_front();
    counters_.evictions.fetch_add(1, std::memory_order_relaxed);

    auto value = store_.extract(oldest);
    logging::logger()->debug("LRUCache: вытеснен ключ '{}' (capacity={})", describeKey(oldest), capacity_);
    if (!value) {
        return std::nullopt;
    }
    return std::make_pair(std::move(oldest), std::move(*value));
}

} // namespace cache
} // namespace core
} // namespace tiercache
