#pragma once
#include "embedder.hpp"
#include "embeddings_cache.hpp"
#include <string>
#include <vector>

namespace embcache {

// Embedder decorator: consult the cache before the wrapped embedder, and
// record what it computes. Empty vectors (embedder failure) are not cached.
// Both references are non-owning and must outlive this object.
class CachedEmbedder : public Embedder {
public:
    CachedEmbedder(Embedder& inner, EmbeddingsCache& cache);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return inner_.dimensions(); }
    std::string embedder_name() const override { return inner_.embedder_name(); }

    // One vector per text, in input order. Each text is looked up and, on a
    // miss, computed individually.
    std::vector<Embedding> embed_documents(const std::vector<std::string>& texts);

    Embedding embed_query(const std::string& text) { return embed(text); }

private:
    Embedder& inner_;
    EmbeddingsCache& cache_;
};

} // namespace embcache
