#include <any>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "tiercache/core/cache/composable/ComposableCache.hpp"
#include "tiercache/core/cache/manager/CacheFactory.hpp"
#include "tiercache/core/cache/manager/CacheRegistry.hpp"
#include "tiercache/core/cache/metrics/CacheConfig.hpp"
#include "tiercache/core/cache/policy/ExpiringCache.hpp"
#include "tiercache/core/cache/policy/LRUCache.hpp"
#include "tiercache/core/logging/Logging.hpp"

using namespace tiercache::core;

namespace {

// Загрузка конфигурации: файл из argv[1] или значения по умолчанию.
// Использование: tiercache_demo [config.json] [log-level]
cache::CacheConfig loadConfig(int argc, char* argv[]) {
    if (argc > 1) {
        return cache::CacheConfig::fromFile(argv[1]);
    }
    cache::CacheConfig config;
    config.policy = "lru";
    config.capacity = 64;
    return config;
}

void initializeLogging(const cache::CacheConfig& config) {
    logging::LoggingConfig loggingConfig;
    loggingConfig.level = config.logLevel;
    loggingConfig.filePath = "logs/tiercache_demo.log";
    logging::initialize(loggingConfig);
    logging::logger()->info("=== tiercache demo starting (policy={}) ===", config.policy);
}

// Нагрузка на кэш из конфигурации: записи, чтения и промахи
void runConfiguredWorkload(const cache::CacheConfig& config, nlohmann::json& report) {
    auto store = cache::CacheFactory::create<std::string, int>(config);

    for (int i = 0; i < 200; ++i) {
        store->set("key_" + std::to_string(i), i);
    }
    size_t hits = 0;
    for (int i = 0; i < 400; ++i) {
        if (store->get("key_" + std::to_string(i % 250))) {
            ++hits;
        }
    }
    logging::logger()->info("Configured cache: {} entries, {} hits of 400 reads", store->size(), hits);

    report["configured"] = {
        {"config", config.toJson()},
        {"size", store->size()},
        {"hits", hits}
    };
    if (auto lru = std::dynamic_pointer_cast<cache::LRUCache<std::string, int>>(store)) {
        report["configured"]["metrics"] = lru->getMetrics().toJson();
    } else if (auto expiring = std::dynamic_pointer_cast<cache::ExpiringCache<std::string, int>>(store)) {
        report["configured"]["metrics"] = expiring->getMetrics().toJson();
    }
}

// Двухуровневый конвейер: маленький LRU перед кэшем с истечением срока
void runPipelineWorkload(cache::CacheRegistry& registry, nlohmann::json& report) {
    auto hot = std::make_shared<cache::LRUCache<std::string, std::any>>(16);
    auto warmExpiration = cache::ExpirationDuration::minutes(5);
    auto warm = std::make_shared<cache::ExpiringCache<std::string, std::any>>(warmExpiration);
    auto pipeline = cache::ComposableCache<std::string>::of(hot, warm);

    registry.registerCache("hot", hot);
    registry.registerCache("warm", warm);

    for (int i = 0; i < 64; ++i) {
        pipeline->set("user_" + std::to_string(i), std::string("name_") + std::to_string(i));
    }
    pipeline->set("answer", 42);

    auto answer = pipeline->resolve<int>("answer");
    auto name = pipeline->get<std::string>("user_3");
    logging::logger()->info("Pipeline: answer={}, user_3={}", answer, name.value_or("<evicted from hot, served by warm>"));

    registry.defaultCache().set("demo.answer", answer);
    size_t migrated = registry.migrateData("warm", "hot");

    report["pipeline"] = {
        {"hotSize", hot->size()},
        {"warmSize", warm->size()},
        {"migrated", migrated},
        {"warmExpiration", {
            {"unit", cache::ExpirationConfig::from(warmExpiration).unit},
            {"value", cache::ExpirationConfig::from(warmExpiration).value}
        }},
        {"hotMetrics", hot->getMetrics().toJson()},
        {"warmMetrics", warm->getMetrics().toJson()}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = loadConfig(argc, argv);
        initializeLogging(config);
        // Второй аргумент переопределяет уровень логов из конфигурации
        if (argc > 2) {
            logging::setLevel(argv[2]);
        }

        cache::CacheRegistry registry;
        nlohmann::json report;

        runConfiguredWorkload(config, report);
        runPipelineWorkload(registry, report);

        auto stats = registry.getStats();
        report["registry"] = {
            {"registered", stats.registeredCount},
            {"migrations", stats.migrationCount},
            {"migratedEntries", stats.migratedEntries}
        };

        std::cout << report.dump(2) << std::endl;
        logging::logger()->info("=== tiercache demo finished ===");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get(logging::kLoggerName)) {
            logging::logger()->critical("Fatal error: {}", e.what());
        }
        return 1;
    }
}
