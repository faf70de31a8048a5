#pragma once
#include "key.hpp"
#include <memory>
#include <optional>
#include <string>

namespace embcache {

// Abstract byte store behind EmbeddingsCache.
// Values are opaque blobs; stores never interpret them.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::string backend_name() const = 0;

    // Stored blob, or nullopt when the key was never written.
    // Remote backends may throw BackendUnavailable or Timeout.
    virtual std::optional<std::string> get(const CacheKey& key) = 0;

    // Store or overwrite the blob at key (last writer wins).
    // Throws BackendUnavailable or Timeout on transport failure.
    virtual void set(const CacheKey& key, const std::string& value) = 0;
};

// Create the configured store. Throws std::invalid_argument for an unknown
// backend name or unusable remote parameters.
struct Config;
std::unique_ptr<CacheStore> create_cache_store(const Config& config);

} // namespace embcache
