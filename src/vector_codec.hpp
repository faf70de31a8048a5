#pragma once
#include "embedder.hpp"
#include <cstdint>
#include <string>

namespace embcache {

// Canonical on-store encoding, all integers little-endian:
//   [0..3)  magic "EVC"
//   [3]     format version
//   [4..8)  dimension n (uint32)
//   [8..)   n IEEE-754 binary32 components
constexpr uint8_t kVectorFormatVersion = 1;
constexpr size_t kVectorHeaderSize = 8;
constexpr uint64_t kMaxVectorDimension = 0xFFFFFFFFu;

// The 8-byte header for a vector of the given dimension. Throws EncodeError
// when the dimension does not fit the uint32 prefix.
std::string encode_vector_header(size_t dimension);

// Serialize an embedding. Components are copied bit-for-bit.
// Throws EncodeError for vectors longer than kMaxVectorDimension.
std::string encode_vector(const Embedding& vec);

// Inverse of encode_vector. Throws DecodeError on a short buffer, bad magic,
// unknown version, or a length that disagrees with the dimension prefix.
Embedding decode_vector(const std::string& data);

} // namespace embcache
