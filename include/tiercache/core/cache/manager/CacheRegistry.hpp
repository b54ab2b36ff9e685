#pragma once

#include <any>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/composable/AnyCacheable.hpp"
#include "tiercache/core/cache/policy/RequiredKeysCache.hpp"

namespace tiercache {
namespace core {
namespace cache {

/**
 * @brief Реестр кэшей приложения.
 * @details Создаётся явно и передаётся тем, кому он нужен; глобального
 *          экземпляра нет. Владеет кэшем по умолчанию и кэшем зависимостей,
 *          которые живут столько же, сколько реестр. Именованные кэши
 *          хранятся как AnyCacheable<std::string>.
 */
class CacheRegistry {
public:
    using NamedCache = std::shared_ptr<AnyCacheable<std::string>>;

    struct RegistryStats {
        size_t registeredCount = 0;    // Сейчас зарегистрировано
        size_t registrationCount = 0;  // Всего успешных регистраций
        size_t migrationCount = 0;     // Выполненных миграций
        size_t migratedEntries = 0;    // Перенесённых записей
        std::chrono::steady_clock::time_point lastMigration;
        double migrationLatency = 0.0; // мс, последняя миграция
    };

    CacheRegistry();
    ~CacheRegistry() = default;

    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    /// Кэш общего назначения.
    KeyValueStore<std::string, std::any>& defaultCache() { return *defaultCache_; }
    std::shared_ptr<KeyValueStore<std::string, std::any>> defaultCachePtr() const { return defaultCache_; }

    /// Кэш зависимостей; изначально без обязательных ключей.
    RequiredKeysCache<std::string, std::any>& dependencies() { return *dependencies_; }

    /// false и предупреждение в логе, если имя занято или cache пуст.
    bool registerCache(const std::string& name, NamedCache cache);

    template<typename Cache>
    bool registerCache(const std::string& name, std::shared_ptr<Cache> cache) {
        if (!cache) {
            return registerCache(name, NamedCache{});
        }
        return registerCache(name, std::make_shared<AnyCacheable<std::string>>(std::move(cache)));
    }

    bool unregisterCache(const std::string& name);
    NamedCache find(const std::string& name) const;
    std::vector<std::string> names() const;

    /**
     * @brief Скопировать все записи source в target.
     * @return Количество скопированных записей; 0, если кэш не найден
     */
    size_t migrateData(const std::string& sourceName, const std::string& targetName);

    RegistryStats getStats() const;

private:
    std::shared_ptr<KeyValueStore<std::string, std::any>> defaultCache_;
    std::shared_ptr<RequiredKeysCache<std::string, std::any>> dependencies_;

    std::unordered_map<std::string, NamedCache> caches_;
    mutable std::mutex mutex_;
    RegistryStats stats_;
};

} // namespace cache
} // namespace core
} // namespace tiercache
