#include "remote_store.hpp"
#include <stdexcept>

namespace embcache {

RemoteStore::RemoteStore(std::unique_ptr<KvClient> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("RemoteStore requires a client");
}

std::optional<std::string> RemoteStore::get(const CacheKey& key) {
    return client_->get(key_to_hex(key));
}

void RemoteStore::set(const CacheKey& key, const std::string& value) {
    client_->set(key_to_hex(key), value);
}

} // namespace embcache
