#pragma once

#include <map>
#include <string>
#include <vector>

#include "emb/EmbeddingProvider.hpp"
#include "tagger/Config.hpp"
#include "tagger/Matcher.hpp"
#include "tagger/Models.hpp"
#include "tagger/TaxonomyTree.hpp"

namespace tagger {

struct LoadedTaxonomy {
    TaxonomySpec spec;
    TaxonomyTree tree;
};

struct Assignment {
    std::string taxonomy;
    MatcherKind matcher = MatcherKind::Greedy;

    // false when no query vector could be produced for the item
    bool available = false;

    // greedy / best_leaf
    Path path;
    std::string value;  // path labels joined by a space

    // multi
    std::vector<MatchResult> matches;

    MatchStats stats;
};

struct ItemTags {
    std::string item_id;
    std::vector<Assignment> assignments;
    std::vector<std::string> warnings;
};

using ProviderMap = std::map<emb::ProviderKind, const emb::EmbeddingProvider*>;

// Non-empty, trimmed values of the named fields joined with ". ", in the given order.
std::string build_item_text(const CatalogItem& item, const std::vector<std::string>& field_names);

class ItemTagger {
public:
    // Throws std::invalid_argument if a taxonomy's provider is missing from
    // `providers` or its tree was embedded in a different space.
    ItemTagger(
        std::vector<LoadedTaxonomy> taxonomies,
        ProviderMap providers,
        std::vector<std::string> text_fields,
        std::vector<std::string> full_text_fields
    );

    ItemTags tag(const CatalogItem& item) const;

    const std::vector<LoadedTaxonomy>& taxonomies() const { return m_taxonomies; }

private:
    std::vector<LoadedTaxonomy> m_taxonomies;
    ProviderMap m_providers;
    std::vector<std::string> m_text_fields;
    std::vector<std::string> m_full_text_fields;
};

}  // namespace tagger
