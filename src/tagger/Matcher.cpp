#include "tagger/Matcher.hpp"

#include <algorithm>
#include <optional>

#include "tagger/Similarity.hpp"

namespace tagger {

// nullopt when the candidate cannot be scored (no embedding, or wrong size)
static std::optional<float> try_score(const TaxonomyNode& n, const Vector& query, MatchStats& st) {
    if (!n.embedding) {
        ++st.missing;
        return std::nullopt;
    }
    try {
        float s = similarity(query, *n.embedding);
        ++st.scored;
        return s;
    } catch (const DimensionMismatch&) {
        ++st.skipped;
        return std::nullopt;
    }
}

Path greedy_match(const TaxonomyTree& tree, const Vector& query, MatchStats* stats) {
    MatchStats local;
    MatchStats& st = stats ? *stats : local;

    Path path;
    const TaxonomyNode* cur = &tree.root();

    while (!cur->is_leaf()) {
        const TaxonomyNode* best = nullptr;
        float best_sim = 0.0f;

        for (const auto& c : cur->children) {
            std::optional<float> s = try_score(c, query, st);
            if (!s) continue;
            if (!best || *s > best_sim) {
                best = &c;
                best_sim = *s;
            }
        }

        if (!best) break;  // nothing scorable at this level: keep the prefix

        path.push_back(best->label);
        cur = best;
    }

    return path;
}

static void collect_leaves(
    const TaxonomyNode& n,
    const Vector& query,
    Path& path,
    std::vector<LeafScore>& out,
    MatchStats& st
) {
    for (const auto& c : n.children) {
        path.push_back(c.label);
        if (c.is_leaf()) {
            std::optional<float> s = try_score(c, query, st);
            if (s) out.push_back({path, *s});
        } else {
            collect_leaves(c, query, path, out, st);
        }
        path.pop_back();
    }
}

std::vector<LeafScore> score_leaves(const TaxonomyTree& tree, const Vector& query, MatchStats* stats) {
    MatchStats local;
    MatchStats& st = stats ? *stats : local;

    std::vector<LeafScore> out;
    out.reserve(tree.leaf_count());

    Path path;
    collect_leaves(tree.root(), query, path, out, st);
    return out;
}

Path best_leaf(const TaxonomyTree& tree, const Vector& query, MatchStats* stats) {
    const std::vector<LeafScore> leaves = score_leaves(tree, query, stats);

    const LeafScore* best = nullptr;
    for (const auto& l : leaves) {
        if (!best || l.similarity > best->similarity) best = &l;
    }
    return best ? best->path : Path{};
}

double percentile_rank_weak(const std::vector<float>& values, float x) {
    if (values.empty()) return 0.0;

    size_t le = 0;
    for (float v : values) {
        if (v <= x) ++le;
    }
    return 100.0 * (double)le / (double)values.size();
}

std::vector<MatchResult> multi_match(
    const TaxonomyTree& tree,
    const Vector& query,
    double threshold,
    MatchStats* stats
) {
    std::vector<LeafScore> leaves = score_leaves(tree, query, stats);
    if (leaves.empty()) return {};

    std::vector<float> sorted;
    sorted.reserve(leaves.size());
    for (const auto& l : leaves) sorted.push_back(l.similarity);
    std::sort(sorted.begin(), sorted.end());

    const double n = (double)sorted.size();

    std::vector<MatchResult> out;
    for (auto& l : leaves) {
        // same count as percentile_rank_weak, via the sorted copy
        const size_t le = (size_t)(std::upper_bound(sorted.begin(), sorted.end(), l.similarity) - sorted.begin());
        const double rank = 100.0 * (double)le / n;

        const double combined = (double)l.similarity * rank / 100.0;
        if (combined >= threshold) {
            out.push_back({std::move(l.path), l.similarity, rank});
        }
    }
    return out;
}

}  // namespace tagger
