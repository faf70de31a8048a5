#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace embcache {

constexpr size_t kCacheKeySize = 32; // SHA-256 digest

using CacheKey = std::array<uint8_t, kCacheKeySize>;

// SHA-256 of the raw text bytes. Pure and total: every input, including
// the empty string, maps to a key. The embedding model is not part of the
// key, so one cache instance must only ever serve one model.
CacheKey derive_key(const std::string& text);

// Lowercase hex rendering (64 chars), used as the remote key.
std::string key_to_hex(const CacheKey& key);

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const {
        // Digest bytes are already uniformly distributed.
        size_t h = 0;
        std::memcpy(&h, key.data(), sizeof(h));
        return h;
    }
};

} // namespace embcache
