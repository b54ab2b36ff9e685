#include <any>
#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "tiercache/core/cache/access/CachedValue.hpp"
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/policy/LRUCache.hpp"

using namespace tiercache::core::cache;

void testCached() {
    auto store = std::make_shared<DefaultKeyValueStore>();
    Cached<std::string, int, std::any> retries("retries", store, 3);
    assert(retries.value() == 3);
    retries.set(5);
    assert(retries.value() == 5);
    assert(store->get<int>("retries").value() == 5);

    // Значение другого типа — тоже значение по умолчанию
    store->set("retries", std::string("five"));
    assert(retries.value() == 3);
    std::cout << "[OK] Cached test\n";
}

void testOptionallyCached() {
    auto store = std::make_shared<LRUCache<std::string, std::string>>(4);
    OptionallyCached<std::string, std::string> token("token", store);
    assert(!token.value());
    token.set(std::string("abc"));
    assert(token.value().value() == "abc");
    token.set(std::nullopt);
    assert(!store->contains("token"));
    std::cout << "[OK] OptionallyCached test\n";
}

void testResolved() {
    auto store = std::make_shared<DefaultKeyValueStore>();
    Resolved<std::string, std::string, std::any> endpoint("endpoint", store);

    bool thrown = false;
    try {
        endpoint.value();
    } catch (const MissingRequiredKeysError<std::string>&) {
        thrown = true;
    }
    assert(thrown);

    store->set("endpoint", 8080);
    thrown = false;
    try {
        endpoint.value();
    } catch (const InvalidTypeError&) {
        thrown = true;
    }
    assert(thrown);

    store->set("endpoint", std::string("localhost"));
    assert(endpoint.value() == "localhost");

    thrown = false;
    try {
        Resolved<std::string, int> broken("x", nullptr);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] Resolved test\n";
}

int main() {
    testCached();
    testOptionallyCached();
    testResolved();
    std::cout << "All value handle tests passed!\n";
    return 0;
}
