#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "emb/EmbeddingCache.hpp"
#include "emb/EmbeddingProvider.hpp"
#include "tagger/Config.hpp"
#include "tagger/ItemTagger.hpp"

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// "out/cache.bin" + fclip -> "out/cache.fclip.bin"
std::string cache_file_for(const std::string& base, emb::ProviderKind kind);

// Models for every provider the taxonomies reference, resolved once, each
// fronted by an embedding cache.
struct ProviderStack {
    std::map<emb::ProviderKind, std::unique_ptr<emb::EmbeddingProvider>> models;
    std::map<emb::ProviderKind, std::unique_ptr<emb::EmbeddingCache>> caches;
    std::map<emb::ProviderKind, std::unique_ptr<emb::CachingEmbeddingProvider>> cached;

    tagger::ProviderMap view() const;
};

// throws std::runtime_error if a referenced provider is unconfigured or fails to load
ProviderStack open_providers(const tagger::TaggerConfig& cfg, const std::string& cache_base);

bool save_caches(const ProviderStack& stack, const std::string& cache_base);

// loads and embeds every configured taxonomy, logging missing embeddings
std::vector<tagger::LoadedTaxonomy> build_taxonomies(
    const tagger::TaggerConfig& cfg,
    const tagger::ProviderMap& providers
);
