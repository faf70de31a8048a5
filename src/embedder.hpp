#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace embcache {

using Embedding = std::vector<float>;

// Abstract embedding provider interface. Implementations live outside this
// library; the cache only needs the single-text call pattern.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text.
    // Implementations return an empty vector on failure.
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

} // namespace embcache
