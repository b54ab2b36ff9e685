#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/metrics/CacheMetrics.hpp"
#include "tiercache/core/cache/policy/ExpirationDuration.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Кэш с ограниченным временем жизни записей.
 * @details Каждое значение хранится вместе с моментом истечения
 *          (steady_clock::now() + duration на момент записи). Запись,
 *          у которой момент истечения <= now, логически отсутствует.
 *          Вытеснение ленивое: истёкшая запись удаляется, когда её
 *          касаются get, resolve или contains, либо при purgeExpired().
 *          Фонового потока нет.
 *
 *          Проверка и вытеснение выполняются под мьютексом политики,
 *          затем берётся мьютекс внутреннего хранилища.
 * @tparam Key Тип ключа
 * @tparam Value Тип значения
 */
template<typename Key, typename Value>
class ExpiringCache : public Cacheable<Key, Value> {
public:
    using Clock = std::chrono::steady_clock;
    using KeySet = typename Cacheable<Key, Value>::KeySet;
    using Snapshot = typename Cacheable<Key, Value>::Snapshot;
    using ValueMatcher = typename Cacheable<Key, Value>::ValueMatcher;

    // Значение вместе с моментом истечения
    struct ExpiringValue {
        Clock::time_point expiration;
        Value value;
    };

    explicit ExpiringCache(ExpirationDuration duration = ExpirationDuration::hours(1),
                           Snapshot initialValues = {});
    ~ExpiringCache() override = default;

    ExpiringCache(const ExpiringCache&) = delete;
    ExpiringCache& operator=(const ExpiringCache&) = delete;

    std::optional<Value> fetch(const Key& key, const ValueMatcher& matcher) override;
    Value fetchRequired(const Key& key, const ValueMatcher& matcher) override;
    void set(const Key& key, const Value& value) override;
    void remove(const Key& key) override;
    bool contains(const Key& key) override;
    void clear() override;
    /// Количество неистёкших записей.
    size_t size() const override;
    /// Истёкшие записи отфильтровываются, но не вытесняются.
    Snapshot snapshot(const ValueMatcher& matcher) const override;
    KeySet missingKeys(const KeySet& keys) override;

    const ExpirationDuration& duration() const { return duration_; }

    /// Вытеснить все истёкшие записи. Возвращает их количество.
    size_t purgeExpired();

    /// Момент истечения живой записи.
    std::optional<Clock::time_point> expirationOf(const Key& key);

    CacheMetrics getMetrics() const;

private:
    // Момент истечения, насыщенный до time_point::max() для очень длинных сроков
    Clock::time_point expirationFrom(Clock::time_point now) const {
        auto ttl = duration_.toDuration();
        if (ttl.count() <= 0) {
            return now;
        }
        auto headroom = std::chrono::duration_cast<std::chrono::seconds>(Clock::time_point::max() - now);
        if (ttl >= headroom) {
            return Clock::time_point::max();
        }
        return now + ttl;
    }

    static bool isExpired(const ExpiringValue& entry, Clock::time_point now) {
        return entry.expiration <= now;
    }

    // Вызывается под mutex_. Пусто, если записи нет или она истекла.
    std::optional<ExpiringValue> lookupLocked(const Key& key);

    const ExpirationDuration duration_;
    KeyValueStore<Key, ExpiringValue> store_;
    std::mutex mutex_;
    CacheCounters counters_;
};

// Реализация шаблонного класса

template<typename Key, typename Value>
ExpiringCache<Key, Value>::ExpiringCache(ExpirationDuration duration, Snapshot initialValues)
    : duration_(duration) {
    auto expiration = expirationFrom(Clock::now());
    for (auto& [key, value] : initialValues) {
        store_.set(key, ExpiringValue{expiration, std::move(value)});
    }
}

template<typename Key, typename Value>
std::optional<typename ExpiringCache<Key, Value>::ExpiringValue>
ExpiringCache<Key, Value>::lookupLocked(const Key& key) {
    auto entry = store_.fetch(key, {});
    if (!entry) {
        return std::nullopt;
    }
    if (isExpired(*entry, Clock::now())) {
        store_.remove(key);
        counters_.expirations.fetch_add(1, std::memory_order_relaxed);
        logging::logger()->debug("ExpiringCache: ключ '{}' истёк и вытеснен", describeKey(key));
        return std::nullopt;
    }
    return entry;
}

template<typename Key, typename Value>
std::optional<Value> ExpiringCache<Key, Value>::fetch(const Key& key, const ValueMatcher& matcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = lookupLocked(key);
    if (!entry || (matcher && !matcher(entry->value))) {
        counters_.recordLookup(false);
        return std::nullopt;
    }
    counters_.recordLookup(true);
    return std::move(entry->value);
}

template<typename Key, typename Value>
Value ExpiringCache<Key, Value>::fetchRequired(const Key& key, const ValueMatcher& matcher) {
    (void)matcher;
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = store_.fetch(key, {});
    if (!entry) {
        counters_.recordLookup(false);
        throw MissingRequiredKeysError<Key>(KeySet{key});
    }
    if (isExpired(*entry, Clock::now())) {
        store_.remove(key);
        counters_.recordLookup(false);
        counters_.expirations.fetch_add(1, std::memory_order_relaxed);
        throw ExpiredValueError<Key>(key, entry->expiration);
    }
    counters_.recordLookup(true);
    return std::move(entry->value);
}

template<typename Key, typename Value>
void ExpiringCache<Key, Value>::set(const Key& key, const Value& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.set(key, ExpiringValue{expirationFrom(Clock::now()), value});
}

template<typename Key, typename Value>
void ExpiringCache<Key, Value>::remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.remove(key);
}

template<typename Key, typename Value>
bool ExpiringCache<Key, Value>::contains(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupLocked(key).has_value();
}

template<typename Key, typename Value>
void ExpiringCache<Key, Value>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.clear();
}

template<typename Key, typename Value>
size_t ExpiringCache<Key, Value>::size() const {
    auto now = Clock::now();
    return store_.snapshot([now](const ExpiringValue& entry) { return !isExpired(entry, now); }).size();
}

template<typename Key, typename Value>
typename ExpiringCache<Key, Value>::Snapshot
ExpiringCache<Key, Value>::snapshot(const ValueMatcher& matcher) const {
    auto now = Clock::now();
    Snapshot result;
    for (auto& [key, entry] : store_.allValues()) {
        if (isExpired(entry, now)) {
            continue;
        }
        if (matcher && !matcher(entry.value)) {
            continue;
        }
        result.emplace(key, std::move(entry.value));
    }
    return result;
}

template<typename Key, typename Value>
typename ExpiringCache<Key, Value>::KeySet
ExpiringCache<Key, Value>::missingKeys(const KeySet& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    KeySet missing;
    for (const auto& key : keys) {
        if (!lookupLocked(key)) {
            missing.insert(key);
        }
    }
    return missing;
}

template<typename Key, typename Value>
size_t ExpiringCache<Key, Value>::purgeExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    auto expiredPredicate = [now](const ExpiringValue& entry) { return isExpired(entry, now); };

    size_t purged = 0;
    for (const auto& entry : store_.snapshot(expiredPredicate)) {
        if (store_.removeIf(entry.first, expiredPredicate)) {
            ++purged;
        }
    }
    if (purged > 0) {
        counters_.expirations.fetch_add(purged, std::memory_order_relaxed);
        logging::logger()->debug("ExpiringCache: вытеснено {} истёкших записей", purged);
    }
    return purged;
}

template<typename Key, typename Value>
std::optional<typename ExpiringCache<Key, Value>::Clock::time_point>
ExpiringCache<Key, Value>::expirationOf(const Key& key) {
    auto entry = store_.fetch(key, {});
    if (!entry || isExpired(*entry, Clock::now())) {
        return std::nullopt;
    }
    return entry->expiration;
}

template<typename Key, typename Value>
CacheMetrics ExpiringCache<Key, Value>::getMetrics() const {
    return counters_.toMetrics(size(), 0);
}

} // namespace cache
} // namespace core
} // namespace tiercache
