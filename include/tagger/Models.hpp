#pragma once
#include <string>
#include <utility>
#include <vector>

#include "emb/EmbeddingProvider.hpp"

namespace tagger {

using emb::Vector;

// labels from the tree root (exclusive) down to a node
using Path = std::vector<std::string>;

// nested label structure as loaded from a taxonomy file; no children = leaf
struct RawNode {
    std::string label;
    std::vector<RawNode> children;
};

struct CatalogItem {
    std::string id;
    std::string image;                                         // local image path
    std::vector<std::pair<std::string, std::string>> fields;   // name, brand, description ...
};

}  // namespace tagger
