#include <catch2/catch_test_macros.hpp>
#include "stores/remote_store.hpp"
#include "cache_error.hpp"
#include "mock_kv_client.hpp"
#include <stdexcept>

using namespace embcache;

struct RemoteFixture {
    MockKvClient* client = nullptr;
    std::unique_ptr<RemoteStore> store;

    RemoteFixture() {
        auto mock = std::make_unique<MockKvClient>();
        client = mock.get();
        store = std::make_unique<RemoteStore>(std::move(mock));
    }
};

// ── Key and value mapping ────────────────────────────────────

TEST_CASE("RemoteStore: sends hex digest as the remote key", "[remote_store]") {
    RemoteFixture f;
    f.store->set(derive_key("hello world"), "blob");
    REQUIRE(f.client->last_key ==
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_CASE("RemoteStore: value bytes pass through unchanged", "[remote_store]") {
    RemoteFixture f;
    std::string blob("EVC\x01\x00\x00\x00\x00", 8);
    f.store->set(derive_key("t"), blob);
    REQUIRE(f.client->last_value == blob);
    REQUIRE(f.store->get(derive_key("t")).value_or("") == blob);
}

TEST_CASE("RemoteStore: absent key returns nullopt", "[remote_store]") {
    RemoteFixture f;
    REQUIRE_FALSE(f.store->get(derive_key("missing")).has_value());
    REQUIRE(f.client->get_count == 1);
}

TEST_CASE("RemoteStore: overwrite is last writer wins", "[remote_store]") {
    RemoteFixture f;
    f.store->set(derive_key("t"), "one");
    f.store->set(derive_key("t"), "two");
    REQUIRE(f.store->get(derive_key("t")).value_or("") == "two");
    REQUIRE(f.client->data.size() == 1);
}

// ── Errors ───────────────────────────────────────────────────

TEST_CASE("RemoteStore: propagates BackendUnavailable", "[remote_store]") {
    RemoteFixture f;
    f.client->unavailable = true;
    REQUIRE_THROWS_AS(f.store->get(derive_key("t")), BackendUnavailable);
    REQUIRE_THROWS_AS(f.store->set(derive_key("t"), "v"), BackendUnavailable);
}

TEST_CASE("RemoteStore: propagates Timeout", "[remote_store]") {
    RemoteFixture f;
    f.client->timeout = true;
    REQUIRE_THROWS_AS(f.store->get(derive_key("t")), Timeout);
}

TEST_CASE("RemoteStore: requires a client", "[remote_store]") {
    REQUIRE_THROWS_AS(RemoteStore(nullptr), std::invalid_argument);
}

TEST_CASE("RemoteStore: backend name", "[remote_store]") {
    RemoteFixture f;
    REQUIRE(f.store->backend_name() == "remote");
}
