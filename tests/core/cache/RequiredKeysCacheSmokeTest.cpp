#include <any>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "tiercache/core/cache/policy/RequiredKeysCache.hpp"

using namespace tiercache::core::cache;

using StringCache = RequiredKeysCache<std::string, std::any>;

void smokeTestRequiredKeysCache() {
    StringCache::Snapshot initial{{"name", std::string("tiercache")}, {"version", 1}};
    StringCache cache(initial);
    assert(cache.requiredKeys().size() == 2);
    assert(cache.isRequired("name"));

    cache.set("extra", 3.5);
    assert(cache.size() == 3);

    // Обязательные ключи не удаляются
    cache.remove("name");
    assert(cache.contains("name"));
    cache.remove("extra");
    assert(!cache.contains("extra"));

    cache.set("extra", 1.5);
    cache.clear();
    assert(cache.size() == 2);
    assert(cache.contains("name") && cache.contains("version"));
    std::cout << "[OK] RequiredKeysCache smoke test\n";
}

void testConstructionValidation() {
    StringCache::Snapshot initial{{"a", 1}};
    bool thrown = false;
    try {
        StringCache cache(StringCache::KeySet{"a", "b", "c"}, initial);
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().size() == 2);
        assert(e.keys().count("b") == 1 && e.keys().count("c") == 1);
    }
    assert(thrown);

    StringCache partial(StringCache::KeySet{"a"}, StringCache::Snapshot{{"a", 1}, {"free", 2}});
    partial.remove("free");
    assert(!partial.contains("free"));
    std::cout << "[OK] RequiredKeysCache construction test\n";
}

void testSetRequiredKeys() {
    StringCache cache(StringCache::KeySet{}, StringCache::Snapshot{});
    assert(cache.requiredKeys().empty());

    cache.set("db", std::string("postgres://"));
    cache.setRequiredKeys({"db"});
    assert(cache.isRequired("db"));

    bool thrown = false;
    try {
        cache.setRequiredKeys({"db", "queue"});
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().count("queue") == 1);
    }
    assert(thrown);
    // Старый набор сохранился
    assert(cache.requiredKeys().size() == 1);
    std::cout << "[OK] RequiredKeysCache setRequiredKeys test\n";
}

void testResolveUpdateUse() {
    StringCache::Snapshot initial{{"counter", 1}, {"name", std::string("core")}};
    StringCache cache(initial);
    cache.set("optional", 5);

    assert(cache.resolveRequired<int>("counter") == 1);

    bool thrown = false;
    try {
        cache.resolveRequired<int>("optional");
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        cache.resolveRequired<int>("name");
    } catch (const InvalidTypeError&) {
        thrown = true;
    }
    assert(thrown);

    auto updated = cache.update<int>("counter", [](int value) { return value + 41; });
    assert(updated == 42);
    assert(cache.get<int>("counter").value() == 42);

    auto length = cache.use<std::string>("name", [](const std::string& name) { return name.size(); });
    assert(length == 4);
    std::cout << "[OK] RequiredKeysCache resolve/update/use test\n";
}

int main() {
    smokeTestRequiredKeysCache();
    testConstructionValidation();
    testSetRequiredKeys();
    testResolveUpdateUse();
    std::cout << "All RequiredKeysCache tests passed!\n";
    return 0;
}
