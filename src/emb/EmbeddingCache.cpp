#include "emb/EmbeddingCache.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>

namespace emb {

std::optional<Vector> EmbeddingCache::get(const std::string& key) const {
    auto it = m_index.find(key);
    if (it == m_index.end()) return std::nullopt;

    const float* v = &m_vecs[it->second * m_dim];
    return Vector(v, v + m_dim);
}

bool EmbeddingCache::put(const std::string& key, const Vector& v) {
    if (v.empty()) return false;
    if (m_dim == 0) m_dim = v.size();
    if (v.size() != m_dim) return false;

    auto it = m_index.find(key);
    if (it != m_index.end()) {
        std::copy(v.begin(), v.end(), m_vecs.begin() + (std::ptrdiff_t)(it->second * m_dim));
        return true;
    }

    m_index.emplace(key, m_keys.size());
    m_keys.push_back(key);
    m_vecs.insert(m_vecs.end(), v.begin(), v.end());
    return true;
}

static void write_string(std::ofstream& out, const std::string& s) {
    uint32_t len = (uint32_t)s.size();
    out.write((char*)&len, sizeof(len));
    out.write(s.data(), len);
}

static bool read_string(std::ifstream& in, std::string& s) {
    uint32_t len = 0;
    in.read((char*)&len, sizeof(len));
    if (!in) return false;
    s.assign(len, '\0');
    in.read(s.data(), len);
    return (bool)in;
}

bool EmbeddingCache::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    write_string(out, m_provider);

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_keys.size();
    out.write((char*)&dim, sizeof(dim));
    out.write((char*)&n, sizeof(n));

    for (const auto& k : m_keys) write_string(out, k);

    uint64_t vec_count = (uint64_t)m_vecs.size();
    out.write((char*)&vec_count, sizeof(vec_count));
    out.write((char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    return (bool)out;
}

bool EmbeddingCache::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    std::string provider;
    if (!read_string(in, provider)) return false;
    // a cache written for another embedding space is useless here
    if (!m_provider.empty() && provider != m_provider) return false;

    uint32_t dim = 0, n = 0;
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in) return false;

    std::vector<std::string> keys;
    keys.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        std::string s;
        if (!read_string(in, s)) return false;
        keys.push_back(std::move(s));
    }

    uint64_t vec_count = 0;
    in.read((char*)&vec_count, sizeof(vec_count));
    if (!in || vec_count != (uint64_t)dim * n) return false;

    std::vector<float> vecs((size_t)vec_count);
    in.read((char*)vecs.data(), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) return false;

    std::unordered_map<std::string, size_t> index;
    index.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) index.emplace(keys[i], i);

    m_provider = std::move(provider);
    m_dim = dim;
    m_keys = std::move(keys);
    m_vecs = std::move(vecs);
    m_index = std::move(index);
    return true;
}

std::optional<Vector> CachingEmbeddingProvider::lookup_or_embed(
    const std::string& key, bool image, const std::string& input) const {
    {
        std::lock_guard<std::mutex> lock(m_mu);
        std::optional<Vector> v = m_cache.get(key);
        if (v) {
            ++m_hits;
            return v;
        }
        ++m_misses;
    }

    // model inference runs unlocked
    std::optional<Vector> v = image ? m_inner.embed_image(input) : m_inner.embed_text(input);
    if (!v || v->empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(m_mu);
    // a vector of another size is still served, just not cached
    (void)m_cache.put(key, *v);
    return v;
}

std::optional<Vector> CachingEmbeddingProvider::embed_text(const std::string& text) const {
    return lookup_or_embed("t:" + text, false, text);
}

std::optional<Vector> CachingEmbeddingProvider::embed_image(const std::string& image_ref) const {
    return lookup_or_embed("i:" + image_ref, true, image_ref);
}

size_t CachingEmbeddingProvider::hits() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_hits;
}

size_t CachingEmbeddingProvider::misses() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_misses;
}

} // namespace emb
