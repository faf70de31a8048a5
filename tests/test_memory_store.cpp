#include <catch2/catch_test_macros.hpp>
#include "stores/memory_store.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace embcache;

// ── Basic get/set ────────────────────────────────────────────

TEST_CASE("InMemoryStore: miss on empty store", "[memory_store]") {
    InMemoryStore store;
    REQUIRE_FALSE(store.get(derive_key("hello")).has_value());
}

TEST_CASE("InMemoryStore: hit after set", "[memory_store]") {
    InMemoryStore store;
    store.set(derive_key("hello"), "blob");

    auto result = store.get(derive_key("hello"));
    REQUIRE(result.has_value());
    REQUIRE(result.value_or("") == "blob");
}

TEST_CASE("InMemoryStore: different key misses", "[memory_store]") {
    InMemoryStore store;
    store.set(derive_key("hello"), "blob");
    REQUIRE_FALSE(store.get(derive_key("goodbye")).has_value());
}

TEST_CASE("InMemoryStore: overwrite replaces value", "[memory_store]") {
    InMemoryStore store;
    auto key = derive_key("k");
    store.set(key, "first");
    store.set(key, "second");
    REQUIRE(store.get(key).value_or("") == "second");
    REQUIRE(store.size() == 1);
}

TEST_CASE("InMemoryStore: binary values pass through", "[memory_store]") {
    InMemoryStore store;
    std::string blob("\x00\xff\r\n\x01", 5);
    store.set(derive_key("bin"), blob);
    REQUIRE(store.get(derive_key("bin")).value_or("") == blob);
}

TEST_CASE("InMemoryStore: empty value is distinct from absent", "[memory_store]") {
    InMemoryStore store;
    store.set(derive_key("empty"), "");
    auto result = store.get(derive_key("empty"));
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
}

// ── Size tracking ────────────────────────────────────────────

TEST_CASE("InMemoryStore: size and clear", "[memory_store]") {
    InMemoryStore store;
    REQUIRE(store.size() == 0);
    store.set(derive_key("a"), "1");
    store.set(derive_key("b"), "2");
    REQUIRE(store.size() == 2);

    store.clear();
    REQUIRE(store.size() == 0);
    REQUIRE_FALSE(store.get(derive_key("a")).has_value());
}

TEST_CASE("InMemoryStore: backend name", "[memory_store]") {
    InMemoryStore store;
    REQUIRE(store.backend_name() == "memory");
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("InMemoryStore: concurrent writers on distinct keys lose nothing", "[memory_store]") {
    InMemoryStore store;
    const int threads = 8;
    const int per_thread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&store, t] {
            for (int i = 0; i < per_thread; ++i) {
                std::string id = std::to_string(t) + ":" + std::to_string(i);
                store.set(derive_key(id), id);
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(store.size() == static_cast<uint32_t>(threads * per_thread));
    for (int t = 0; t < threads; ++t) {
        for (int i = 0; i < per_thread; ++i) {
            std::string id = std::to_string(t) + ":" + std::to_string(i);
            REQUIRE(store.get(derive_key(id)).value_or("") == id);
        }
    }
}

TEST_CASE("InMemoryStore: concurrent get sees old or new value, never partial", "[memory_store]") {
    InMemoryStore store;
    auto key = derive_key("contended");
    const std::string old_value(4096, 'a');
    const std::string new_value(4096, 'b');
    store.set(key, old_value);

    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) store.set(key, (i % 2) ? old_value : new_value);
    });

    bool all_whole = true;
    for (int i = 0; i < 2000; ++i) {
        auto v = store.get(key);
        if (!v || (*v != old_value && *v != new_value)) all_whole = false;
    }
    writer.join();
    REQUIRE(all_whole);
}
