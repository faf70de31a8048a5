#pragma once
#include "../cache_store.hpp"
#include "../kv_client.hpp"
#include <memory>

namespace embcache {

// Cache store backed by a network key-value service. Keys go over the wire
// as 64-char hex digests; values pass through unchanged. Transport errors
// from the client (BackendUnavailable, Timeout) propagate to the caller.
class RemoteStore : public CacheStore {
public:
    explicit RemoteStore(std::unique_ptr<KvClient> client);

    std::string backend_name() const override { return "remote"; }

    std::optional<std::string> get(const CacheKey& key) override;
    void set(const CacheKey& key, const std::string& value) override;

private:
    std::unique_ptr<KvClient> client_;
};

} // namespace embcache
