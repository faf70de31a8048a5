#pragma once
#include "../cache_store.hpp"
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace embcache {

// Process-lifetime map from key to blob. Unbounded: nothing is evicted.
// One mutex guards the whole map; every operation is O(1).
class InMemoryStore : public CacheStore {
public:
    std::string backend_name() const override { return "memory"; }

    std::optional<std::string> get(const CacheKey& key) override;
    void set(const CacheKey& key, const std::string& value) override;

    uint32_t size() const;
    void clear();

private:
    std::unordered_map<CacheKey, std::string, CacheKeyHash> entries_;
    mutable std::mutex mutex_;
};

} // namespace embcache
