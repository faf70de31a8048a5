#include "vector_codec.hpp"
#include "cache_error.hpp"
#include <cstring>

namespace embcache {

static const char kMagic[3] = {'E', 'V', 'C'};

static void put_u32(std::string& out, uint32_t v) {
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 24) & 0xFF);
}

static uint32_t get_u32(const std::string& data, size_t offset) {
    auto b = [&](size_t i) {
        return static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i]));
    };
    return b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24);
}

std::string encode_vector_header(size_t dimension) {
    if (static_cast<uint64_t>(dimension) > kMaxVectorDimension)
        throw EncodeError("vector dimension " + std::to_string(dimension) +
                          " exceeds the encodable maximum");
    std::string header;
    header.append(kMagic, sizeof(kMagic));
    header += static_cast<char>(kVectorFormatVersion);
    put_u32(header, static_cast<uint32_t>(dimension));
    return header;
}

std::string encode_vector(const Embedding& vec) {
    std::string data = encode_vector_header(vec.size());
    data.reserve(kVectorHeaderSize + sizeof(float) * vec.size());

    for (float f : vec) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        put_u32(data, bits);
    }
    return data;
}

Embedding decode_vector(const std::string& data) {
    if (data.size() < kVectorHeaderSize)
        throw DecodeError("vector blob too short: " + std::to_string(data.size()) + " bytes");
    if (std::memcmp(data.data(), kMagic, sizeof(kMagic)) != 0)
        throw DecodeError("vector blob has bad magic");

    auto version = static_cast<uint8_t>(data[3]);
    if (version != kVectorFormatVersion)
        throw DecodeError("unsupported vector format version " + std::to_string(version));

    uint64_t dims = get_u32(data, 4);
    uint64_t expected = kVectorHeaderSize + dims * sizeof(float);
    if (data.size() != expected) {
        throw DecodeError("vector blob length " + std::to_string(data.size()) +
                          " does not match dimension " + std::to_string(dims));
    }

    Embedding vec(static_cast<size_t>(dims));
    for (size_t i = 0; i < vec.size(); ++i) {
        uint32_t bits = get_u32(data, kVectorHeaderSize + i * sizeof(float));
        std::memcpy(&vec[i], &bits, sizeof(bits));
    }
    return vec;
}

} // namespace embcache
