#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace embcache {

nlohmann::json Config::defaults_json() {
    return {
        {"backend", "memory"},
        {"remote", {
            {"host", "127.0.0.1"},
            {"port", 6379},
            {"username", ""},
            {"password", ""},
            {"database", 0},
            {"tls", false},
            {"tls_ca_file", ""},
            {"timeout_ms", 1000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("backend") && j["backend"].is_string())
        cfg.backend = j["backend"].get<std::string>();

    if (j.contains("remote") && j["remote"].is_object()) {
        auto& r = j["remote"];
        if (r.contains("host") && r["host"].is_string())
            cfg.remote.host = r["host"].get<std::string>();
        if (r.contains("port") && r["port"].is_number_unsigned()) {
            auto port = r["port"].get<uint64_t>();
            if (port > 0 && port <= std::numeric_limits<uint16_t>::max())
                cfg.remote.port = static_cast<uint16_t>(port);
        }
        if (r.contains("username") && r["username"].is_string())
            cfg.remote.username = r["username"].get<std::string>();
        if (r.contains("password") && r["password"].is_string())
            cfg.remote.password = r["password"].get<std::string>();
        if (r.contains("database") && r["database"].is_number_unsigned()) {
            auto db = r["database"].get<uint64_t>();
            if (db <= std::numeric_limits<uint32_t>::max())
                cfg.remote.database = static_cast<uint32_t>(db);
        }
        if (r.contains("tls") && r["tls"].is_boolean())
            cfg.remote.tls = r["tls"].get<bool>();
        if (r.contains("tls_ca_file") && r["tls_ca_file"].is_string())
            cfg.remote.tls_ca_file = r["tls_ca_file"].get<std::string>();
        if (r.contains("timeout_ms") && r["timeout_ms"].is_number_unsigned()) {
            auto ms = r["timeout_ms"].get<uint64_t>();
            if (ms <= std::numeric_limits<uint32_t>::max())
                cfg.remote.timeout_ms = static_cast<uint32_t>(ms);
        }
    }
    return cfg;
}

Config Config::load() {
    return load(expand_home("~/.embcache/config.json"));
}

Config Config::load(const std::string& path) {
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("EMBCACHE_BACKEND"))
        backend = trim(v);
    if (const char* v = std::getenv("EMBCACHE_REDIS_HOST"))
        remote.host = trim(v);
    if (const char* v = std::getenv("EMBCACHE_REDIS_PORT")) {
        auto port = parse_uint(v);
        if (port && *port > 0 && *port <= std::numeric_limits<uint16_t>::max())
            remote.port = static_cast<uint16_t>(*port);
        else
            std::cerr << "[config] Ignoring invalid EMBCACHE_REDIS_PORT: " << v << "\n";
    }
    if (const char* v = std::getenv("EMBCACHE_REDIS_USERNAME"))
        remote.username = v;
    if (const char* v = std::getenv("EMBCACHE_REDIS_PASSWORD"))
        remote.password = v;
    if (const char* v = std::getenv("EMBCACHE_REDIS_DB")) {
        auto db = parse_uint(v);
        if (db && *db <= std::numeric_limits<uint32_t>::max())
            remote.database = static_cast<uint32_t>(*db);
        else
            std::cerr << "[config] Ignoring invalid EMBCACHE_REDIS_DB: " << v << "\n";
    }
    if (const char* v = std::getenv("EMBCACHE_REDIS_TLS")) {
        auto tls = parse_bool(v);
        if (tls)
            remote.tls = *tls;
        else
            std::cerr << "[config] Ignoring invalid EMBCACHE_REDIS_TLS: " << v << "\n";
    }
    if (const char* v = std::getenv("EMBCACHE_REDIS_TLS_CA_FILE"))
        remote.tls_ca_file = expand_home(trim(v));
    if (const char* v = std::getenv("EMBCACHE_REDIS_TIMEOUT_MS")) {
        auto ms = parse_uint(v);
        if (ms && *ms <= std::numeric_limits<uint32_t>::max())
            remote.timeout_ms = static_cast<uint32_t>(*ms);
        else
            std::cerr << "[config] Ignoring invalid EMBCACHE_REDIS_TIMEOUT_MS: " << v << "\n";
    }
}

} // namespace embcache
