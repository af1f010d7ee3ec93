#include "tagger/TaxonomyTree.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace tagger {

const char* embedding_policy_str(EmbeddingPolicy p) {
    switch (p) {
        case EmbeddingPolicy::Label: return "label";
        case EmbeddingPolicy::Path: return "path";
        default: return "unknown";
    }
}

bool parse_embedding_policy(const std::string& name, EmbeddingPolicy& out) {
    if (name == "label") { out = EmbeddingPolicy::Label; return true; }
    if (name == "path")  { out = EmbeddingPolicy::Path; return true; }
    return false;
}

const TaxonomyNode* TaxonomyNode::child(const std::string& child_label) const {
    for (const auto& c : children) {
        if (c.label == child_label) return &c;
    }
    return nullptr;
}

TaxonomyTree::TaxonomyTree(TaxonomyNode root, emb::ProviderKind provider, EmbeddingPolicy policy)
    : m_root(std::move(root)), m_provider(provider), m_policy(policy) {
    // the root is a pure container: always Internal, may be empty
    if (m_root.is_leaf() && !m_root.children.empty()) {
        throw std::invalid_argument("taxonomy root tagged Leaf but has children");
    }
    m_root.kind = NodeKind::Internal;
    validate(m_root, 0, true);
}

void TaxonomyTree::validate(const TaxonomyNode& n, size_t level, bool is_root) {
    if (!is_root) {
        ++m_nodes;
        m_depth = std::max(m_depth, level);
    }

    if (n.embedding && m_dim == 0) m_dim = n.embedding->size();

    if (n.is_leaf()) {
        if (!n.children.empty()) {
            throw std::invalid_argument("taxonomy leaf '" + n.label + "' has children");
        }
        ++m_leaves;
        return;
    }

    if (n.children.empty() && !is_root) {
        throw std::invalid_argument("taxonomy internal node '" + n.label + "' has no children");
    }

    std::unordered_set<std::string> seen;
    seen.reserve(n.children.size());
    for (const auto& c : n.children) {
        if (!seen.insert(c.label).second) {
            throw std::invalid_argument("duplicate sibling label '" + c.label + "' under '" + n.label + "'");
        }
        validate(c, level + 1, false);
    }
}

const TaxonomyNode* TaxonomyTree::find(const Path& path) const {
    const TaxonomyNode* cur = &m_root;
    for (const auto& label : path) {
        cur = cur->child(label);
        if (!cur) return nullptr;
    }
    return cur;
}

static std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string trim_copy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    return s.substr(a, b - a);
}

std::string leaf_phrase(const Path& path) {
    std::string joined;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        if (!joined.empty()) joined += ' ';
        joined += *it;
    }
    return trim_copy("a photo of a " + to_lower_copy(joined));
}

namespace {

struct BuildContext {
    const emb::EmbeddingProvider& provider;
    EmbeddingPolicy policy;
    BuildReport& report;
    size_t dim = 0;
};

std::optional<Vector> embed_node(BuildContext& ctx, const std::string& text, const Path& path) {
    ++ctx.report.embed_calls;
    std::optional<Vector> v = ctx.provider.embed_text(text);
    if (!v || v->empty()) {
        ctx.report.missing.push_back(path);
        return std::nullopt;
    }

    if (ctx.dim == 0) ctx.dim = v->size();
    else if (v->size() != ctx.dim) ctx.report.dim_mismatched.push_back(path);

    return v;
}

TaxonomyNode build_node(BuildContext& ctx, const RawNode& raw, Path& path) {
    TaxonomyNode n;
    n.label = raw.label;
    n.kind = raw.children.empty() ? NodeKind::Leaf : NodeKind::Internal;

    if (ctx.policy == EmbeddingPolicy::Label) {
        n.embedding = embed_node(ctx, raw.label, path);
    } else if (n.is_leaf()) {
        n.embedding = embed_node(ctx, leaf_phrase(path), path);
    }

    n.children.reserve(raw.children.size());
    for (const auto& rc : raw.children) {
        path.push_back(rc.label);
        n.children.push_back(build_node(ctx, rc, path));
        path.pop_back();
    }
    return n;
}

}  // namespace

TaxonomyTree build_tree(
    const RawNode& root,
    const emb::EmbeddingProvider& provider,
    EmbeddingPolicy policy,
    BuildReport* report
) {
    BuildReport local;
    BuildContext ctx{provider, policy, report ? *report : local};

    TaxonomyNode r;
    r.kind = NodeKind::Internal;
    r.label = root.label;
    r.children.reserve(root.children.size());

    Path path;
    for (const auto& rc : root.children) {
        path.push_back(rc.label);
        r.children.push_back(build_node(ctx, rc, path));
        path.pop_back();
    }

    return TaxonomyTree(std::move(r), provider.kind(), policy);
}

}  // namespace tagger
