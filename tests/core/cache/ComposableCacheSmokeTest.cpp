#include <any>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "tiercache/core/cache/base/KeyValueStore.hpp"
#include "tiercache/core/cache/composable/AnyCacheable.hpp"
#include "tiercache/core/cache/composable/ComposableCache.hpp"
#include "tiercache/core/cache/policy/ExpiringCache.hpp"
#include "tiercache/core/cache/policy/LRUCache.hpp"

using namespace tiercache::core::cache;

void testAnyCacheable() {
    auto ints = std::make_shared<KeyValueStore<std::string, int>>();
    AnyCacheable<std::string> erased(ints);

    erased.set("a", std::any(1));
    assert(ints->get("a").value() == 1);
    assert(erased.get<int>("a").value() == 1);
    assert(!erased.get<std::string>("a"));

    // Несовместимая запись молча игнорируется
    erased.set("b", std::any(std::string("text")));
    assert(!ints->contains("b"));
    assert(erased.size() == 1);

    assert(erased.valueTypeName() == "int");
    assert(erased.unwrap<int>() == ints);
    assert(erased.unwrap<double>() == nullptr);

    bool thrown = false;
    try {
        erased.resolve<std::string>("a");
    } catch (const InvalidTypeError& e) {
        thrown = true;
        assert(e.actualType() == "int");
    }
    assert(thrown);

    erased.remove("a");
    assert(ints->size() == 0);
    std::cout << "[OK] AnyCacheable test\n";
}

void testReadPrecedence() {
    auto first = std::make_shared<KeyValueStore<std::string, int>>();
    auto second = std::make_shared<KeyValueStore<std::string, std::string>>();
    auto pipeline = ComposableCache<std::string>::of(first, second);
    assert(pipeline->stages().size() == 2);

    first->set("shared", 1);
    second->set("shared", "one");
    second->set("onlySecond", "two");

    // Побеждает первая ступень с совместимым типом
    assert(pipeline->get<int>("shared").value() == 1);
    assert(pipeline->get<std::string>("shared").value() == "one");
    assert(pipeline->get<std::string>("onlySecond").value() == "two");
    assert(!pipeline->get<int>("onlySecond"));
    assert(pipeline->contains("onlySecond"));
    assert(!pipeline->contains("absent"));

    // Несовпадение типа на всех ступенях
    bool thrown = false;
    try {
        pipeline->resolve<double>("shared");
    } catch (const InvalidTypeError& e) {
        thrown = true;
        assert(e.expectedType() == "double");
        assert(e.actualType() == "int");
    }
    assert(thrown);

    thrown = false;
    try {
        pipeline->resolve<int>("absent");
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().count("absent") == 1);
    }
    assert(thrown);

    assert(pipeline->resolve<std::string>("onlySecond") == "two");
    std::cout << "[OK] ComposableCache read precedence test\n";
}

void testFanOutWrites() {
    auto hot = std::make_shared<LRUCache<std::string, std::any>>(2);
    auto warm = std::make_shared<ExpiringCache<std::string, std::any>>(ExpirationDuration::minutes(5));
    auto pipeline = ComposableCache<std::string>::of(hot, warm);

    pipeline->set("a", 1);
    assert(hot->get<int>("a").value() == 1);
    assert(warm->get<int>("a").value() == 1);

    pipeline->set("b", 2);
    pipeline->set("c", 3);
    // Из горячей ступени "a" вытеснен, но читается из второй
    assert(!hot->contains("a"));
    assert(pipeline->get<int>("a").value() == 1);
    assert(pipeline->size() == 2);

    pipeline->remove("c");
    assert(!hot->contains("c"));
    assert(!warm->contains("c"));

    pipeline->clear();
    assert(hot->size() == 0);
    assert(warm->size() == 0);
    std::cout << "[OK] ComposableCache fan-out test\n";
}

void testRequireUnion() {
    auto first = std::make_shared<KeyValueStore<std::string, int>>();
    auto second = std::make_shared<KeyValueStore<std::string, int>>();
    auto pipeline = ComposableCache<std::string>::of(first, second);

    first->set("a", 1);
    second->set("b", 2);

    bool thrown = false;
    try {
        pipeline->requireKeys({"a", "b"});
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().size() == 2);
        assert(e.keys().count("a") == 1 && e.keys().count("b") == 1);
    }
    assert(thrown);

    pipeline->set("c", 3);
    pipeline->require("c");
    std::cout << "[OK] ComposableCache require test\n";
}

void testValuesOfTypeFirstMatch() {
    auto first = std::make_shared<KeyValueStore<std::string, int>>();
    auto second = std::make_shared<KeyValueStore<std::string, std::string>>();
    auto pipeline = ComposableCache<std::string>::of(first, second);

    second->set("x", "1");
    second->set("y", "2");
    first->set("z", 3);

    auto strings = pipeline->valuesOfType<std::string>();
    assert(strings.size() == 2);
    auto ints = pipeline->valuesOfType<int>();
    assert(ints.size() == 1 && ints.at("z") == 3);

    // Первый непустой снимок, а не объединение
    assert(pipeline->allValues().size() == 1);
    std::cout << "[OK] ComposableCache valuesOfType test\n";
}

void testInitialValues() {
    ComposableCache<std::string> cache(ComposableCache<std::string>::Snapshot{{"a", 1}, {"b", std::string("two")}});
    assert(cache.stages().size() == 1);
    assert(cache.size() == 2);
    assert(cache.get<int>("a").value() == 1);
    assert(cache.resolve<std::string>("b") == "two");

    std::vector<ComposableCache<std::string>::Stage> stages;
    bool thrown = false;
    try {
        stages.push_back(nullptr);
        ComposableCache<std::string> broken(stages);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] ComposableCache initial values test\n";
}

int main() {
    testAnyCacheable();
    testReadPrecedence();
    testFanOutWrites();
    testRequireUnion();
    testValuesOfTypeFirstMatch();
    testInitialValues();
    std::cout << "All ComposableCache tests passed!\n";
    return 0;
}
