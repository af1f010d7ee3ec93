#pragma once

#include <map>
#include <string>
#include <vector>

#include "emb/EmbeddingProvider.hpp"
#include "emb/ProviderFactory.hpp"
#include "tagger/TaxonomyTree.hpp"

namespace tagger {

enum class MatcherKind {
    Greedy,
    BestLeaf,
    Multi
};

const char* matcher_kind_str(MatcherKind m);
bool parse_matcher_kind(const std::string& name, MatcherKind& out);

// which configured field list feeds the item's text embedding
enum class TextScope {
    Short,
    Full
};

struct TaxonomySpec {
    std::string name;
    std::string path;  // taxonomy JSON file
    emb::ProviderKind provider = emb::ProviderKind::Baseline;
    EmbeddingPolicy policy = EmbeddingPolicy::Label;
    MatcherKind matcher = MatcherKind::Greedy;
    TextScope text = TextScope::Short;
    double threshold = 0.25;  // multi only
};

struct TaggerConfig {
    std::map<emb::ProviderKind, emb::ProviderConfig> providers;

    std::vector<std::string> text_fields;
    std::vector<std::string> full_text_fields;

    std::vector<TaxonomySpec> taxonomies;

    std::string cache_path;  // optional embedding cache
};

}  // namespace tagger
