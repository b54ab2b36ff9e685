#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "tiercache/core/cache/persistence/CacheFile.hpp"
#include "tiercache/core/cache/policy/ExpirationDuration.hpp"

namespace tiercache {
namespace core {
namespace cache {

// Срок жизни записей для политики "expiring"
struct ExpirationConfig {
    std::string unit = "hours";   // seconds|minutes|hours
    int64_t value = 1;            // Не больше ExpirationDuration::kMaxSeconds в сумме

    static ExpirationConfig from(const ExpirationDuration& duration);

    /// @throws std::invalid_argument для неизвестной единицы
    ExpirationDuration toDuration() const;
};

// Унифицированная конфигурация кэша
struct CacheConfig {
    std::string policy = "lru";         // plain|lru|expiring|persistent
    size_t capacity = 1024;             // Ёмкость для lru
    ExpirationConfig expiration;        // Для expiring
    PersistenceConfig persistence;      // Для persistent
    std::string logLevel = "info";

    bool validate() const;

    nlohmann::json toJson() const;

    /// @throws std::runtime_error при неизвестной политике или неверной конфигурации
    /// @throws nlohmann::json::exception при неверных типах полей
    static CacheConfig fromJson(const nlohmann::json& json);

    /// @throws std::runtime_error если файл не открывается
    static CacheConfig fromFile(const std::filesystem::path& path);
};

} // namespace cache
} // namespace core
} // namespace tiercache
