#include <any>
#include <cassert>
#include <iostream>
#include <list>
#include <string>
#include <utility>
#include <vector>
#include "tiercache/core/cache/policy/LRUCache.hpp"

using namespace tiercache::core::cache;

void smokeTestLRUCache() {
    LRUCache<std::string, int> cache(3);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("c", 3);
    assert(cache.size() == 3);
    cache.set("d", 4); // вытесняется "a"
    assert(cache.size() == 3);
    assert(!cache.contains("a"));
    assert(cache.get("d").value() == 4);
    cache.remove("d");
    cache.remove("d");
    assert(!cache.get("d"));
    assert(cache.recencyOrder().size() == 2);
    cache.clear();
    assert(cache.size() == 0);
    assert(cache.recencyOrder().empty());
    std::cout << "[OK] LRUCache smoke test\n";
}

void testEvictionOrder() {
    const int capacity = 5;
    LRUCache<int, int> cache(capacity);
    for (int i = 0; i <= capacity; ++i) {
        cache.set(i, i * 10);
    }
    assert(cache.size() == static_cast<size_t>(capacity));
    assert(!cache.contains(0));
    for (int i = 1; i <= capacity; ++i) {
        assert(cache.get(i).value() == i * 10);
    }
    std::cout << "[OK] LRUCache eviction order test\n";
}

void testPromotion() {
    LRUCache<int, int> cache(3);
    cache.set(1, 1);
    cache.set(2, 2);
    cache.set(3, 3);
    assert(cache.get(1)); // 1 становится самым свежим
    cache.set(4, 4);
    assert(cache.contains(1));
    assert(!cache.contains(2));
    assert(cache.contains(3));
    assert(cache.contains(4));

    // contains тоже продвигает ключ
    LRUCache<int, int> second(2);
    second.set(1, 1);
    second.set(2, 2);
    assert(second.contains(1));
    second.set(3, 3);
    assert(second.contains(1));
    assert(!second.contains(2));

    // resolve продвигает ключ
    LRUCache<int, int> third(2);
    third.set(1, 1);
    third.set(2, 2);
    assert(third.resolve(1) == 1);
    third.set(3, 3);
    auto order = third.recencyOrder();
    assert((order == std::list<int>{1, 3}));
    std::cout << "[OK] LRUCache promotion test\n";
}

void testTypeMismatchDoesNotPromote() {
    LRUCache<std::string, std::any> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    assert(!cache.get<std::string>("a")); // несовпадение типа: без продвижения
    cache.set("c", 3);
    assert(!cache.contains("a"));
    assert(cache.contains("b"));

    bool thrown = false;
    try {
        cache.resolve<std::string>("b");
    } catch (const InvalidTypeError& e) {
        thrown = true;
        assert(e.expectedType().find("string") != std::string::npos);
    }
    assert(thrown);
    std::cout << "[OK] LRUCache type mismatch test\n";
}

void testZeroCapacity() {
    LRUCache<std::string, int> cache(0);
    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const std::string& key, const int&) {
        evicted.push_back(key);
    });
    cache.set("a", 1);
    cache.set("b", 2);
    assert(cache.size() == 0);
    assert(!cache.get("a"));
    assert((evicted == std::vector<std::string>{"a", "b"}));
    std::cout << "[OK] LRUCache zero capacity test\n";
}

void testInitialValues() {
    LRUCache<std::string, int> implicitCapacity(LRUCache<std::string, int>::Snapshot{{"a", 1}, {"b", 2}});
    assert(implicitCapacity.capacity() == 2);
    assert(implicitCapacity.size() == 2);
    implicitCapacity.set("c", 3);
    assert(implicitCapacity.size() == 2);

    LRUCache<std::string, int> shrunk(1, LRUCache<std::string, int>::Snapshot{{"a", 1}, {"b", 2}, {"c", 3}});
    assert(shrunk.capacity() == 1);
    assert(shrunk.size() == 1);
    assert(shrunk.recencyOrder().size() == 1);
    std::cout << "[OK] LRUCache initial values test\n";
}

void testEvictionCallbackReentrancy() {
    LRUCache<std::string, int> cache(1);
    std::vector<std::pair<std::string, int>> evicted;
    cache.setEvictionCallback([&cache, &evicted](const std::string& key, const int& value) {
        evicted.emplace_back(key, value);
        // Блокировки уже сняты: можно обращаться к кэшу
        assert(!cache.contains(key));
    });
    cache.set("a", 1);
    cache.set("b", 2);
    assert(evicted.size() == 1);
    assert(evicted[0].first == "a" && evicted[0].second == 1);
    std::cout << "[OK] LRUCache eviction callback test\n";
}

void testMetrics() {
    LRUCache<std::string, int> cache(2);
    cache.set("a", 1);
    cache.set("b", 2);
    cache.get("a");
    cache.get("zzz");
    cache.set("c", 3);
    auto metrics = cache.getMetrics();
    assert(metrics.hits == 1);
    assert(metrics.misses == 1);
    assert(metrics.evictions == 1);
    assert(metrics.entryCount == 2);
    assert(metrics.capacity == 2);
    assert(metrics.hitRate == 0.5);
    auto json = metrics.toJson();
    assert(json["evictions"].get<size_t>() == 1);
    std::cout << "[OK] LRUCache metrics test\n";
}

void stressTestLRUCache() {
    LRUCache<std::string, int> cache(128);
    for (int i = 0; i < 10000; ++i) {
        cache.set(std::to_string(i), i);
    }
    assert(cache.size() == 128);
    assert(cache.recencyOrder().size() == 128);
    for (int i = 0; i < 10000; ++i) {
        cache.remove(std::to_string(i));
    }
    assert(cache.size() == 0);
    std::cout << "[OK] LRUCache stress test\n";
}

int main() {
    smokeTestLRUCache();
    testEvictionOrder();
    testPromotion();
    testTypeMismatchDoesNotPromote();
    testZeroCapacity();
    testInitialValues();
    testEvictionCallbackReentrancy();
    testMetrics();
    stressTestLRUCache();
    std::cout << "All LRUCache tests passed!\n";
    return 0;
}
