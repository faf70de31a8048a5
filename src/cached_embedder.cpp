#include "cached_embedder.hpp"

namespace embcache {

CachedEmbedder::CachedEmbedder(Embedder& inner, EmbeddingsCache& cache)
    : inner_(inner), cache_(cache) {}

Embedding CachedEmbedder::embed(const std::string& text) {
    if (auto cached = cache_.lookup(text)) return std::move(*cached);

    Embedding vec = inner_.embed(text);
    if (!vec.empty()) cache_.update(text, vec);
    return vec;
}

std::vector<Embedding> CachedEmbedder::embed_documents(const std::vector<std::string>& texts) {
    std::vector<Embedding> result;
    result.reserve(texts.size());
    for (const auto& text : texts) {
        result.push_back(embed(text));
    }
    return result;
}

} // namespace embcache
