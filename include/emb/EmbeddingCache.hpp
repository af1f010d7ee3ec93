#pragma once
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "emb/EmbeddingProvider.hpp"

namespace emb {

// key -> vector store for one provider space
class EmbeddingCache {
public:
    explicit EmbeddingCache(std::string provider_name = "") : m_provider(std::move(provider_name)) {}

    std::optional<Vector> get(const std::string& key) const;

    // returns false if v's size differs from the cache dimension
    bool put(const std::string& key, const Vector& v);

    // cache I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    const std::string& provider() const { return m_provider; }
    size_t dim() const { return m_dim; }
    size_t size() const { return m_keys.size(); }

private:
    std::string m_provider;
    size_t m_dim = 0;
    std::vector<std::string> m_keys;
    std::vector<float> m_vecs; // packed: size = size()*dim()
    std::unordered_map<std::string, size_t> m_index;
};

// Serves vectors from a cache and fills it from the wrapped provider.
// Absent results are not cached.
class CachingEmbeddingProvider final : public EmbeddingProvider {
public:
    CachingEmbeddingProvider(const EmbeddingProvider& inner, EmbeddingCache& cache)
        : m_inner(inner), m_cache(cache) {}

    ProviderKind kind() const override { return m_inner.kind(); }
    std::optional<Vector> embed_text(const std::string& text) const override;
    std::optional<Vector> embed_image(const std::string& image_ref) const override;

    size_t hits() const;
    size_t misses() const;

private:
    const EmbeddingProvider& m_inner;
    EmbeddingCache& m_cache;

    mutable std::mutex m_mu;
    mutable size_t m_hits = 0;
    mutable size_t m_misses = 0;

    std::optional<Vector> lookup_or_embed(const std::string& key, bool image, const std::string& input) const;
};

} // namespace emb
