#include <any>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "tiercache/core/cache/base/KeyValueStore.hpp"

using namespace tiercache::core::cache;

namespace {

struct Shape {
    virtual ~Shape() = default;
};
struct Circle : Shape {
    explicit Circle(double r) : radius(r) {}
    double radius;
};
struct Square : Shape {};

} // namespace

void smokeTestKeyValueStore() {
    KeyValueStore<std::string, int> store;
    store.set("a", 1);
    store.set("b", 2);
    assert(store.size() == 2);
    assert(store.get("a").value() == 1);
    assert(store.contains("b"));
    assert(!store.get("zzz"));

    store.set("a", 10);
    assert(store.resolve("a") == 10);

    store.remove("a");
    store.remove("a");
    assert(!store.contains("a"));
    assert(store.size() == 1);

    store.clear();
    assert(store.size() == 0);
    std::cout << "[OK] KeyValueStore smoke test\n";
}

void testTypedAccess() {
    DefaultKeyValueStore store;
    store.set("int", 42);
    store.set("text", std::string("hello"));
    store.set("pi", 3.14);

    assert(store.get<int>("int").value() == 42);
    assert(store.get<std::string>("text").value() == "hello");
    // Без неявных числовых преобразований
    assert(!store.get<double>("int"));
    assert(!store.get<int>("pi"));

    bool thrown = false;
    try {
        store.resolve<double>("int");
    } catch (const InvalidTypeError& e) {
        thrown = true;
        assert(e.expectedType() == "double");
        assert(e.actualType() == "int");
        assert(std::string(e.what()) == "Invalid Type: (Expected: double) got int");
    }
    assert(thrown);

    thrown = false;
    try {
        store.resolve<int>("missing");
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().size() == 1);
        assert(e.keys().count("missing") == 1);
        assert(std::string(e.what()) == "Missing Required Keys: missing");
    }
    assert(thrown);

    auto ints = store.valuesOfType<int>();
    assert(ints.size() == 1);
    assert(ints.at("int") == 42);
    assert(store.allValues().size() == 3);
    std::cout << "[OK] KeyValueStore typed access test\n";
}

void testVariantAndPointerValues() {
    KeyValueStore<std::string, std::variant<int, std::string>> variants;
    variants.set("n", 5);
    variants.set("s", std::string("five"));
    assert(variants.get<int>("n").value() == 5);
    assert(!variants.get<std::string>("n"));
    assert(variants.valuesOfType<std::string>().size() == 1);

    bool thrown = false;
    try {
        variants.resolve<std::string>("n");
    } catch (const InvalidTypeError& e) {
        thrown = true;
        assert(e.actualType() == "int");
    }
    assert(thrown);

    KeyValueStore<std::string, std::shared_ptr<Shape>> shapes;
    shapes.set("circle", std::make_shared<Circle>(2.0));
    shapes.set("square", std::make_shared<Square>());
    auto circle = shapes.get<std::shared_ptr<Circle>>("circle");
    assert(circle && (*circle)->radius == 2.0);
    assert(!shapes.get<std::shared_ptr<Circle>>("square"));
    assert(shapes.valuesOfType<std::shared_ptr<Square>>().size() == 1);
    std::cout << "[OK] KeyValueStore variant/pointer test\n";
}

void testRequire() {
    KeyValueStore<std::string, int> store;
    store.set("a", 1);
    store.set("b", 2);

    store.require("a").require("b");
    store.requireKeys({"a", "b"});

    bool thrown = false;
    try {
        store.requireKeys({"a", "c", "d"});
    } catch (const MissingRequiredKeysError<std::string>& e) {
        thrown = true;
        assert(e.keys().size() == 2);
        assert(e.keys().count("c") == 1 && e.keys().count("d") == 1);
        assert(std::string(e.what()) == "Missing Required Keys: c, d");
    }
    assert(thrown);

    KeyValueStore<int, std::string> numbered;
    thrown = false;
    try {
        numbered.require(7);
    } catch (const MissingRequiredKeysError<int>& e) {
        thrown = true;
        assert(std::string(e.what()) == "Missing Required Keys: 7");
    }
    assert(thrown);
    std::cout << "[OK] KeyValueStore require test\n";
}

void testObservers() {
    KeyValueStore<std::string, int> store;
    std::vector<ChangeKind> kinds;
    auto id = store.subscribe([&kinds](const CacheChange<std::string, int>& change) {
        kinds.push_back(change.kind);
    });

    store.set("a", 1);
    store.remove("a");
    store.remove("a"); // отсутствующий ключ не порождает уведомления
    store.clear();
    assert(kinds.size() == 3);
    assert(kinds[0] == ChangeKind::Set);
    assert(kinds[1] == ChangeKind::Removed);
    assert(kinds[2] == ChangeKind::Cleared);

    store.unsubscribe(id);
    store.set("b", 2);
    assert(kinds.size() == 3);

    // Обработчик читает и пишет в то же хранилище
    store.subscribe([&store](const CacheChange<std::string, int>& change) {
        if (change.kind == ChangeKind::Set && change.key && *change.key == "source") {
            auto value = store.get("source");
            store.set("mirror", value.value_or(-1) * 2);
        }
    });
    store.set("source", 21);
    assert(store.get("mirror").value() == 42);
    std::cout << "[OK] KeyValueStore observer test\n";
}

void testRemoveIf() {
    KeyValueStore<std::string, int> store;
    store.set("small", 1);
    store.set("large", 100);
    auto isLarge = [](const int& value) { return value > 10; };

    assert(!store.removeIf("small", isLarge));
    assert(store.contains("small"));
    auto removed = store.removeIf("large", isLarge);
    assert(removed && *removed == 100);
    assert(!store.contains("large"));
    assert(!store.removeIf("absent", isLarge));

    auto extracted = store.extract("small");
    assert(extracted && *extracted == 1);
    assert(store.size() == 0);
    std::cout << "[OK] KeyValueStore removeIf test\n";
}

void testAnyViewOfTypedStore() {
    KeyValueStore<std::string, int> store;
    store.set("a", 1);
    store.set("b", 2);

    // std::any принимает значение любого типа
    auto boxed = store.valuesOfType<std::any>();
    assert(boxed.size() == 2);
    assert(std::any_cast<int>(boxed.at("b")) == 2);

    auto single = store.get<std::any>("a");
    assert(single.has_value());
    assert(std::any_cast<int>(*single) == 1);
    assert(std::any_cast<int>(store.resolve<std::any>("a")) == 1);
    assert(!store.get<std::any>("missing"));
    std::cout << "[OK] KeyValueStore std::any view test\n";
}

int main() {
    smokeTestKeyValueStore();
    testTypedAccess();
    testVariantAndPointerValues();
    testRequire();
    testObservers();
    testRemoveIf();
    testAnyViewOfTypedStore();
    std::cout << "All KeyValueStore tests passed!\n";
    return 0;
}
