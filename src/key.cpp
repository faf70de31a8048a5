#include "key.hpp"

#include <openssl/sha.h>

namespace embcache {

CacheKey derive_key(const std::string& text) {
    CacheKey key{};
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), key.data());
    return key;
}

std::string key_to_hex(const CacheKey& key) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(key.size() * 2);
    for (uint8_t byte : key) {
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

} // namespace embcache
