#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace tiercache {
namespace core {
namespace cache {

struct CacheMetrics {
    size_t entryCount = 0;          // Количество записей
    size_t capacity = 0;            // Ёмкость (0 — без ограничения)
    size_t hits = 0;                // Попадания
    size_t misses = 0;              // Промахи
    size_t evictions = 0;           // Вытеснения по ёмкости
    size_t expirations = 0;         // Вытеснения по сроку жизни
    double hitRate = 0.0;           // Частота попаданий
    std::chrono::steady_clock::time_point lastUpdate; // Время снятия метрик

    nlohmann::json toJson() const {
        return {
            {"entryCount", entryCount},
            {"capacity", capacity},
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"expirations", expirations},
            {"hitRate", hitRate},
            {"lastUpdate", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

// Счётчики, которые политики обновляют без блокировок
struct CacheCounters {
    std::atomic<size_t> hits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> evictions{0};
    std::atomic<size_t> expirations{0};

    void recordLookup(bool hit) {
        if (hit) {
            hits.fetch_add(1, std::memory_order_relaxed);
        } else {
            misses.fetch_add(1, std::memory_order_relaxed);
        }
    }

    CacheMetrics toMetrics(size_t entryCount, size_t capacity) const {
        CacheMetrics metrics;
        metrics.entryCount = entryCount;
        metrics.capacity = capacity;
        metrics.hits = hits.load(std::memory_order_relaxed);
        metrics.misses = misses.load(std::memory_order_relaxed);
        metrics.evictions = evictions.load(std::memory_order_relaxed);
        metrics.expirations = expirations.load(std::memory_order_relaxed);
        auto total = metrics.hits + metrics.misses;
        metrics.hitRate = total > 0 ? static_cast<double>(metrics.hits) / total : 0.0;
        metrics.lastUpdate = std::chrono::steady_clock::now();
        return metrics;
    }
};

} // namespace cache
} // namespace core
} // namespace tiercache
