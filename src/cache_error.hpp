#pragma once
#include <stdexcept>
#include <string>

namespace embcache {

// Base for every recoverable cache failure. EmbeddingsCache catches this
// family and turns it into a miss (lookup) or a no-op (update).
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Network or service failure, including error replies from the server.
class BackendUnavailable : public CacheError {
public:
    using CacheError::CacheError;
};

// Operation exceeded the configured wait.
class Timeout : public CacheError {
public:
    using CacheError::CacheError;
};

// Stored blob is corrupt or written by an unknown format version.
class DecodeError : public CacheError {
public:
    using CacheError::CacheError;
};

// Vector cannot be represented in the stored format.
class EncodeError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace embcache
