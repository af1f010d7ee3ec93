#pragma once

#include <cstddef>
#include <vector>

#include "tagger/Models.hpp"
#include "tagger/TaxonomyTree.hpp"

namespace tagger {

struct MatchStats {
    size_t scored = 0;   // similarities computed
    size_t skipped = 0;  // candidates dropped on DimensionMismatch
    size_t missing = 0;  // candidates without an embedding
};

struct LeafScore {
    Path path;
    float similarity = 0.0f;
};

struct MatchResult {
    Path path;
    float similarity = 0.0f;  // raw cosine
    double rank = 0.0;        // weak percentile rank, 0..100
};

// Descend one level at a time, always into the most similar child.
// Returns the labels from the root to where the descent stopped.
Path greedy_match(const TaxonomyTree& tree, const Vector& query, MatchStats* stats = nullptr);

// Globally most similar leaf; empty path if no leaf can be scored.
Path best_leaf(const TaxonomyTree& tree, const Vector& query, MatchStats* stats = nullptr);

// Every scorable leaf in depth-first, taxonomy order.
std::vector<LeafScore> score_leaves(const TaxonomyTree& tree, const Vector& query, MatchStats* stats = nullptr);

// 100 * |{v in values : v <= x}| / |values|; 0 for an empty set
double percentile_rank_weak(const std::vector<float>& values, float x);

// Leaves with similarity * rank / 100 >= threshold. The threshold is not validated.
std::vector<MatchResult> multi_match(
    const TaxonomyTree& tree,
    const Vector& query,
    double threshold,
    MatchStats* stats = nullptr
);

}  // namespace tagger
