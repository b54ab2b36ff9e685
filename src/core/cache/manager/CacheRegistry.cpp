#include "tiercache/core/cache/manager/CacheRegistry.hpp"
#include "tiercache/core/logging/Logging.hpp"
#include <algorithm>

namespace tiercache {
namespace core {
namespace cache {

CacheRegistry::CacheRegistry()
    : defaultCache_(std::make_shared<KeyValueStore<std::string, std::any>>())
    , dependencies_(std::make_shared<RequiredKeysCache<std::string, std::any>>(
          RequiredKeysCache<std::string, std::any>::KeySet{},
          RequiredKeysCache<std::string, std::any>::Snapshot{})) {}

bool CacheRegistry::registerCache(const std::string& name, NamedCache cache) {
    if (!cache) {
        logging::logger()->warn("CacheRegistry: кэш '{}' не задан", name);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (caches_.find(name) != caches_.end()) {
        logging::logger()->warn("CacheRegistry: кэш '{}' уже зарегистрирован", name);
        return false;
    }

    caches_.emplace(name, std::move(cache));
    stats_.registeredCount = caches_.size();
    ++stats_.registrationCount;
    logging::logger()->info("CacheRegistry: кэш '{}' зарегистрирован", name);
    return true;
}

bool CacheRegistry::unregisterCache(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        logging::logger()->warn("CacheRegistry: кэш '{}' не найден", name);
        return false;
    }

    caches_.erase(it);
    stats_.registeredCount = caches_.size();
    logging::logger()->info("CacheRegistry: кэш '{}' удалён из реестра", name);
    return true;
}

CacheRegistry::NamedCache CacheRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    return it != caches_.end() ? it->second : nullptr;
}

std::vector<std::string> CacheRegistry::names() const {
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(caches_.size());
        for (const auto& entry : caches_) {
            result.push_back(entry.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t CacheRegistry::migrateData(const std::string& sourceName, const std::string& targetName) {
    NamedCache source;
    NamedCache target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto sourceIt = caches_.find(sourceName);
        auto targetIt = caches_.find(targetName);
        if (sourceIt == caches_.end() || targetIt == caches_.end()) {
            logging::logger()->warn("CacheRegistry: миграция '{}' -> '{}' невозможна: кэш не найден",
                                    sourceName, targetName);
            return 0;
        }
        if (sourceName == targetName) {
            logging::logger()->warn("CacheRegistry: миграция '{}' в самого себя пропущена", sourceName);
            return 0;
        }
        source = sourceIt->second;
        target = targetIt->second;
    }

    // Копирование идёт без блокировки реестра: кэши защищают себя сами
    auto startTime = std::chrono::steady_clock::now();
    auto values = source->allValues();
    for (const auto& [key, value] : values) {
        target->set(key, value);
    }
    auto endTime = std::chrono::steady_clock::now();
    auto latency = std::chrono::duration<double, std::milli>(endTime - startTime).count();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.migrationCount;
        stats_.migratedEntries += values.size();
        stats_.lastMigration = endTime;
        stats_.migrationLatency = latency;
    }

    logging::logger()->info("CacheRegistry: перенесено {} записей '{}' -> '{}' за {:.3f}ms",
                            values.size(), sourceName, targetName, latency);
    return values.size();
}

CacheRegistry::RegistryStats CacheRegistry::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace cache
} // namespace core
} // namespace tiercache
