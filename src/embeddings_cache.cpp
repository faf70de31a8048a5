#include "embeddings_cache.hpp"
#include "cache_error.hpp"
#include "config.hpp"
#include "vector_codec.hpp"
#include <iostream>
#include <stdexcept>

namespace embcache {

EmbeddingsCache::EmbeddingsCache(std::unique_ptr<CacheStore> store) : store_(std::move(store)) {
    if (!store_) throw std::invalid_argument("EmbeddingsCache requires a store");
}

bool EmbeddingsCache::recover(const char* operation, const std::function<void()>& op) {
    try {
        op();
        return true;
    } catch (const CacheError& e) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[cache] " << operation << " on " << store_->backend_name()
                  << " store failed: " << e.what() << "\n";
        return false;
    }
}

std::optional<Embedding> EmbeddingsCache::lookup(const std::string& text) {
    CacheKey key = derive_key(text);

    std::optional<Embedding> result;
    bool ok = recover("lookup", [&] {
        auto blob = store_->get(key);
        if (blob) result = decode_vector(*blob);
    });

    if (ok && result) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

void EmbeddingsCache::update(const std::string& text, const Embedding& vector) {
    CacheKey key = derive_key(text);
    if (recover("update", [&] { store_->set(key, encode_vector(vector)); })) {
        writes_.fetch_add(1, std::memory_order_relaxed);
    }
}

CacheStats EmbeddingsCache::stats() const {
    CacheStats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.errors = errors_.load(std::memory_order_relaxed);
    s.writes = writes_.load(std::memory_order_relaxed);
    return s;
}

std::unique_ptr<EmbeddingsCache> create_embeddings_cache(const Config& config) {
    return std::make_unique<EmbeddingsCache>(create_cache_store(config));
}

} // namespace embcache
