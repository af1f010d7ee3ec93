#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "emb/EmbeddingProvider.hpp"
#include "tagger/Models.hpp"

namespace tagger {

enum class NodeKind {
    Internal,
    Leaf
};

enum class EmbeddingPolicy {
    Label,  // every node embedded from its own label (greedy / best-leaf trees)
    Path    // only leaves, embedded from "a photo of a <reversed path>" (multi-match trees)
};

const char* embedding_policy_str(EmbeddingPolicy p);
bool parse_embedding_policy(const std::string& name, EmbeddingPolicy& out);

struct TaxonomyNode {
    NodeKind kind = NodeKind::Leaf;
    std::string label;

    // unset when the provider failed; such a node is never a match candidate
    std::optional<Vector> embedding;

    // Internal only, in taxonomy order
    std::vector<TaxonomyNode> children;

    bool is_leaf() const { return kind == NodeKind::Leaf; }
    const TaxonomyNode* child(const std::string& child_label) const;
};

struct BuildReport {
    size_t embed_calls = 0;
    std::vector<Path> missing;          // provider returned nothing
    std::vector<Path> dim_mismatched;   // size differs from the first embedding seen
};

class TaxonomyTree {
public:
    // Validates the Internal/Leaf invariant and sibling label uniqueness.
    // Throws std::invalid_argument on a malformed tree.
    TaxonomyTree(TaxonomyNode root, emb::ProviderKind provider, EmbeddingPolicy policy);

    const TaxonomyNode& root() const { return m_root; }
    emb::ProviderKind provider() const { return m_provider; }
    EmbeddingPolicy policy() const { return m_policy; }

    // size of the first embedding in the tree, 0 if none
    size_t dim() const { return m_dim; }

    size_t node_count() const { return m_nodes; }
    size_t leaf_count() const { return m_leaves; }
    size_t depth() const { return m_depth; }

    // nullptr if the path does not name a node
    const TaxonomyNode* find(const Path& path) const;

private:
    TaxonomyNode m_root;
    emb::ProviderKind m_provider;
    EmbeddingPolicy m_policy;

    size_t m_dim = 0;
    size_t m_nodes = 0;
    size_t m_leaves = 0;
    size_t m_depth = 0;

    void validate(const TaxonomyNode& n, size_t level, bool is_root);
};

// "a photo of a <labels leaf-to-root, space joined>", lower-cased and trimmed
std::string leaf_phrase(const Path& path);

TaxonomyTree build_tree(
    const RawNode& root,
    const emb::EmbeddingProvider& provider,
    EmbeddingPolicy policy,
    BuildReport* report = nullptr
);

}  // namespace tagger
