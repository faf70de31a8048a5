#include "cache_store.hpp"
#include "config.hpp"
#include "stores/memory_store.hpp"
#include "stores/remote_store.hpp"
#include <stdexcept>

namespace embcache {

std::unique_ptr<CacheStore> create_cache_store(const Config& config) {
    if (config.backend == "memory") {
        return std::make_unique<InMemoryStore>();
    }

    if (config.backend == "remote" || config.backend == "redis") {
        if (config.remote.host.empty())
            throw std::invalid_argument("Remote cache backend needs a host");
        if (config.remote.port == 0)
            throw std::invalid_argument("Remote cache backend needs a port");
        if (config.remote.timeout_ms == 0)
            throw std::invalid_argument("Remote cache backend needs a non-zero timeout_ms");
        return std::make_unique<RemoteStore>(std::make_unique<RedisClient>(config.remote));
    }

    throw std::invalid_argument("Unknown cache backend: " + config.backend);
}

} // namespace embcache
