#pragma once

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "tiercache/core/cache/base/ValueCast.hpp"

namespace tiercache {
namespace core {
namespace cache {

// CacheError — базовый класс всех ошибок библиотеки
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Отсутствуют обязательные ключи.
 * @details Содержит полный набор отсутствующих ключей, а не только первый.
 * @tparam Key Тип ключа
 */
template<typename Key>
class MissingRequiredKeysError : public CacheError {
public:
    using KeySet = std::unordered_set<Key>;

    explicit MissingRequiredKeysError(KeySet keys)
        : CacheError(makeMessage(keys)), keys_(std::move(keys)) {}

    const KeySet& keys() const noexcept { return keys_; }

private:
    static std::string makeMessage(const KeySet& keys) {
        std::vector<std::string> names;
        names.reserve(keys.size());
        for (const auto& key : keys) {
            names.push_back(describeKey(key));
        }
        std::sort(names.begin(), names.end());

        std::string message = "Missing Required Keys: ";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) message += ", ";
            message += names[i];
        }
        return message;
    }

    KeySet keys_;
};

// InvalidTypeError — значение есть, но не приводится к запрошенному типу
class InvalidTypeError : public CacheError {
public:
    InvalidTypeError(std::string expectedType, std::string actualType)
        : CacheError("Invalid Type: (Expected: " + expectedType + ") got " + actualType)
        , expectedType_(std::move(expectedType))
        , actualType_(std::move(actualType)) {}

    const std::string& expectedType() const noexcept { return expectedType_; }
    const std::string& actualType() const noexcept { return actualType_; }

private:
    std::string expectedType_;
    std::string actualType_;
};

/**
 * @brief Значение существовало, но срок его жизни истёк.
 * @details Отличается от MissingRequiredKeysError: ключ был записан,
 *          но к моменту чтения устарел и был вытеснен.
 */
template<typename Key>
class ExpiredValueError : public CacheError {
public:
    using Clock = std::chrono::steady_clock;

    ExpiredValueError(Key key, Clock::time_point expiration)
        : CacheError(makeMessage(key, expiration))
        , key_(std::move(key))
        , expiration_(expiration) {}

    const Key& key() const noexcept { return key_; }
    Clock::time_point expiration() const noexcept { return expiration_; }

private:
    static std::string makeMessage(const Key& key, Clock::time_point expiration) {
        auto ago = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - expiration);
        return "Expired Key: " + describeKey(key) + " (expired " + std::to_string(ago.count()) + "ms ago)";
    }

    Key key_;
    Clock::time_point expiration_;
};

// PersistenceError — ошибка чтения/записи файла кэша
class PersistenceError : public CacheError {
public:
    PersistenceError(const std::string& message, std::filesystem::path path)
        : CacheError(message + ": " + path.string()), path_(std::move(path)) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
