#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include "tiercache/core/cache/base/Cacheable.hpp"

namespace tiercache {
namespace core {
namespace cache {

namespace detail {

template<typename Key, typename Value>
std::shared_ptr<Cacheable<Key, Value>> requireCache(std::shared_ptr<Cacheable<Key, Value>> cache) {
    if (!cache) {
        throw std::invalid_argument("Cache handle requires a cache");
    }
    return cache;
}

} // namespace detail

/**
 * @brief Доступ к значению по фиксированному ключу со значением по умолчанию.
 * @details value() возвращает get<T>(key) или defaultValue, если ключа нет
 *          или он другого типа.
 */
template<typename Key, typename T, typename Value = T>
class Cached {
public:
    Cached(Key key, std::shared_ptr<Cacheable<Key, Value>> cache, T defaultValue)
        : key_(std::move(key))
        , cache_(detail::requireCache(std::move(cache)))
        , defaultValue_(std::move(defaultValue)) {}

    T value() const {
        if (auto value = cache_->template get<T>(key_)) {
            return std::move(*value);
        }
        return defaultValue_;
    }

    void set(const T& value) { cache_->set(key_, Value(value)); }

    const Key& key() const { return key_; }

private:
    Key key_;
    std::shared_ptr<Cacheable<Key, Value>> cache_;
    T defaultValue_;
};

// Доступ к необязательному значению: set(std::nullopt) удаляет ключ
template<typename Key, typename T, typename Value = T>
class OptionallyCached {
public:
    OptionallyCached(Key key, std::shared_ptr<Cacheable<Key, Value>> cache)
        : key_(std::move(key)), cache_(detail::requireCache(std::move(cache))) {}

    std::optional<T> value() const {
        return cache_->template get<T>(key_);
    }

    void set(const std::optional<T>& value) {
        if (value) {
            cache_->set(key_, Value(*value));
        } else {
            cache_->remove(key_);
        }
    }

    const Key& key() const { return key_; }

private:
    Key key_;
    std::shared_ptr<Cacheable<Key, Value>> cache_;
};

/**
 * @brief Доступ к значению, которое обязано быть в кэше.
 * @throws MissingRequiredKeysError, InvalidTypeError из value()
 */
template<typename Key, typename T, typename Value = T>
class Resolved {
public:
    Resolved(Key key, std::shared_ptr<Cacheable<Key, Value>> cache)
        : key_(std::move(key)), cache_(detail::requireCache(std::move(cache))) {}

    T value() const {
        return cache_->template resolve<T>(key_);
    }

    const Key& key() const { return key_; }

private:
    Key key_;
    std::shared_ptr<Cacheable<Key, Value>> cache_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
