#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace embcache {

// Connection parameters for the remote (Redis-protocol) backend.
struct RemoteConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    std::string username;          // empty = legacy AUTH <password>
    std::string password;          // empty = no AUTH
    uint32_t database = 0;         // non-zero sends SELECT after connect
    bool tls = false;
    std::string tls_ca_file;       // PEM trust anchors; empty = system store
    uint32_t timeout_ms = 1000;    // bound on connect, send and receive
};

struct Config {
    std::string backend = "memory"; // "memory" | "remote" ("redis" alias)
    RemoteConfig remote;

    // Load from ~/.embcache/config.json + env vars
    static Config load();

    // Load from an explicit file path + env vars. Missing or malformed
    // files fall back to defaults.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config object. Fields with the wrong type keep their defaults.
    static Config from_json(const nlohmann::json& j);

    // Apply EMBCACHE_* environment overrides in place.
    void apply_env();
};

} // namespace embcache
