#include "commands/CommandUtil.hpp"

#include "emb/ProviderFactory.hpp"
#include "io/JsonIO.hpp"
#include "tagger/TaxonomyTree.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

std::string cache_file_for(const std::string& base, emb::ProviderKind kind) {
    const fs::path p(base);
    const std::string ext = p.has_extension() ? p.extension().string() : std::string(".bin");
    const std::string name = p.stem().string() + "." + emb::provider_kind_str(kind) + ext;
    return (p.parent_path() / name).string();
}

tagger::ProviderMap ProviderStack::view() const {
    tagger::ProviderMap m;
    for (const auto& kv : cached) m[kv.first] = kv.second.get();
    return m;
}

ProviderStack open_providers(const tagger::TaggerConfig& cfg, const std::string& cache_base) {
    std::set<emb::ProviderKind> needed;
    for (const auto& t : cfg.taxonomies) needed.insert(t.provider);

    ProviderStack stack;
    for (emb::ProviderKind kind : needed) {
        const char* name = emb::provider_kind_str(kind);

        auto it = cfg.providers.find(kind);
        if (it == cfg.providers.end()) {
            throw std::runtime_error(std::string("no configuration for provider: ") + name);
        }

        std::unique_ptr<emb::EmbeddingProvider> model = emb::make_provider(kind, it->second);
        if (!model) {
            throw std::runtime_error(std::string("failed to init embedding provider: ") + name);
        }

        auto cache = std::make_unique<emb::EmbeddingCache>(name);
        if (!cache_base.empty()) {
            const std::string path = cache_file_for(cache_base, kind);
            if (fs::exists(path)) {
                if (cache->load(path)) {
                    std::cout << "loaded cache: " << path << " (n=" << cache->size() << ", dim=" << cache->dim() << ")\n";
                } else {
                    std::cerr << "warning: ignoring unreadable or foreign cache: " << path << "\n";
                }
            }
        }

        auto cached = std::make_unique<emb::CachingEmbeddingProvider>(*model, *cache);

        stack.models[kind] = std::move(model);
        stack.caches[kind] = std::move(cache);
        stack.cached[kind] = std::move(cached);
    }
    return stack;
}

bool save_caches(const ProviderStack& stack, const std::string& cache_base) {
    if (cache_base.empty()) return true;

    const fs::path parent = fs::path(cache_base).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    bool ok = true;
    for (const auto& kv : stack.caches) {
        const std::string path = cache_file_for(cache_base, kv.first);
        if (!kv.second->save(path)) {
            std::cerr << "error: failed to save embedding cache to " << path << "\n";
            ok = false;
            continue;
        }
        std::cout << "saved: " << path << " (n=" << kv.second->size() << ", dim=" << kv.second->dim() << ")\n";
    }
    return ok;
}

static std::string path_str(const tagger::Path& p) {
    std::string s;
    for (const auto& label : p) {
        if (!s.empty()) s += " -> ";
        s += label;
    }
    return s;
}

std::vector<tagger::LoadedTaxonomy> build_taxonomies(
    const tagger::TaggerConfig& cfg,
    const tagger::ProviderMap& providers
) {
    std::vector<tagger::LoadedTaxonomy> out;
    out.reserve(cfg.taxonomies.size());

    for (const auto& spec : cfg.taxonomies) {
        auto it = providers.find(spec.provider);
        if (it == providers.end() || !it->second) {
            throw std::runtime_error("taxonomy '" + spec.name + "': provider not available: " +
                                     emb::provider_kind_str(spec.provider));
        }

        const tagger::RawNode raw = loadTaxonomy(spec.path);

        tagger::BuildReport report;
        tagger::TaxonomyTree tree = tagger::build_tree(raw, *it->second, spec.policy, &report);

        for (const auto& p : report.missing) {
            std::cerr << "warning: taxonomy " << spec.name << ": no embedding for " << path_str(p) << "\n";
        }
        for (const auto& p : report.dim_mismatched) {
            std::cerr << "warning: taxonomy " << spec.name << ": embedding size differs for " << path_str(p) << "\n";
        }

        std::cout << "embedded taxonomy " << spec.name
                  << " (provider=" << emb::provider_kind_str(spec.provider)
                  << ", policy=" << tagger::embedding_policy_str(spec.policy)
                  << ", nodes=" << tree.node_count()
                  << ", leaves=" << tree.leaf_count()
                  << ", missing=" << report.missing.size() << ")\n";

        out.push_back(tagger::LoadedTaxonomy{spec, std::move(tree)});
    }
    return out;
}
