#pragma once
#include "cache_store.hpp"
#include "embedder.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace embcache {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t errors = 0;   // backend or decode failures (each also counted as a miss on lookup)
    uint64_t writes = 0;   // successful updates
};

// Text -> embedding cache in front of an expensive embedder.
//
// Callers lookup() before computing and update() after a miss. Cache
// failures never reach the caller: lookup degrades to a miss and update to
// a no-op, with the error logged to stderr and counted in stats().
//
// Keys do not include the embedding model, so one instance must only be
// used with one model. Thread-safe whenever the store is.
class EmbeddingsCache {
public:
    explicit EmbeddingsCache(std::unique_ptr<CacheStore> store);

    EmbeddingsCache(const EmbeddingsCache&) = delete;
    EmbeddingsCache& operator=(const EmbeddingsCache&) = delete;

    // Cached vector for text, or nullopt on miss / backend failure / corrupt entry.
    std::optional<Embedding> lookup(const std::string& text);

    // Best-effort store of vector under text.
    void update(const std::string& text, const Embedding& vector);

    CacheStats stats() const;
    const CacheStore& store() const { return *store_; }

private:
    // Runs op, converting any CacheError into false (logged + counted).
    bool recover(const char* operation, const std::function<void()>& op);

    std::unique_ptr<CacheStore> store_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> writes_{0};
};

// Build the configured store and wrap it in a cache.
// Throws std::invalid_argument on an unusable configuration.
struct Config;
std::unique_ptr<EmbeddingsCache> create_embeddings_cache(const Config& config);

} // namespace embcache
