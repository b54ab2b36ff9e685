#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/metrics/CacheConfig.hpp"
#include "tiercache/core/cache/persistence/PersistableCache.hpp"
#include "tiercache/core/cache/policy/ExpiringCache.hpp"
#include "tiercache/core/cache/policy/LRUCache.hpp"
#include "tiercache/core/logging/Logging.hpp"

namespace tiercache {
namespace core {
namespace cache {

// Создание кэша по конфигурации
class CacheFactory {
public:
    /**
     * @brief Создать кэш с политикой из config.
     * @throws std::runtime_error при неверной конфигурации или если для
     *         политики "persistent" тип ключа или значения не сериализуется
     */
    template<typename Key, typename Value>
    static std::shared_ptr<Cacheable<Key, Value>> create(const CacheConfig& config,
                                                         typename Cacheable<Key, Value>::Snapshot initialValues = {}) {
        if (!config.validate()) {
            throw std::runtime_error("Invalid cache configuration for policy '" + config.policy + "'");
        }

        logging::logger()->debug("CacheFactory: создаётся кэш '{}' <{}, {}>",
                                 config.policy, typeName<Key>(), typeName<Value>());

        if (config.policy == "plain") {
            return std::make_shared<KeyValueStore<Key, Value>>(std::move(initialValues));
        }
        if (config.policy == "lru") {
            return std::make_shared<LRUCache<Key, Value>>(config.capacity, std::move(initialValues));
        }
        if (config.policy == "expiring") {
            return std::make_shared<ExpiringCache<Key, Value>>(config.expiration.toDuration(), std::move(initialValues));
        }
        if (config.policy == "persistent") {
            if constexpr (is_json_persistable<Key>::value && is_json_persistable<Value>::value) {
                return std::make_shared<PersistableCache<Key, Value>>(config.persistence, std::move(initialValues));
            } else {
                throw std::runtime_error("Policy 'persistent' requires JSON-serializable key and value types, got <" +
                                         typeName<Key>() + ", " + typeName<Value>() + ">");
            }
        }
        throw std::runtime_error("Unknown cache policy: " + config.policy);
    }
};

} // namespace cache
} // namespace core
} // namespace tiercache
