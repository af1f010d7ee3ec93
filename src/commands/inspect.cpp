#include "commands/inspect.hpp"
#include "commands/CommandUtil.hpp"

#include "emb/EmbeddingProvider.hpp"
#include "io/JsonIO.hpp"
#include "tagger/TaxonomyTree.hpp"

#include <iostream>
#include <string>

static void print_node(const tagger::TaxonomyNode& n, tagger::Path& path, tagger::EmbeddingPolicy policy) {
    for (const auto& c : n.children) {
        path.push_back(c.label);
        std::cout << std::string(2 * (path.size() - 1), ' ') << c.label;
        if (c.is_leaf() && policy == tagger::EmbeddingPolicy::Path) {
            std::cout << "  [" << tagger::leaf_phrase(path) << "]";
        }
        std::cout << "\n";
        if (!c.is_leaf()) print_node(c, path, policy);
        path.pop_back();
    }
}

int cmd_inspect(int argc, char** argv) {
    try {
        const std::string taxonomy_path = get_arg(argc, argv, "--taxonomy", "");
        const std::string policy_name = get_arg(argc, argv, "--policy", "label");

        if (taxonomy_path.empty()) {
            std::cerr << "error: --taxonomy is required\n";
            return 1;
        }

        tagger::EmbeddingPolicy policy;
        if (!tagger::parse_embedding_policy(policy_name, policy)) {
            std::cerr << "error: --policy must be label or path\n";
            return 1;
        }

        // structure only: no model involved
        const emb::NullEmbeddingProvider none;
        const tagger::TaxonomyTree tree = tagger::build_tree(loadTaxonomy(taxonomy_path), none, policy);

        tagger::Path path;
        print_node(tree.root(), path, policy);

        std::cout << "TAXONOMY: " << taxonomy_path << "\n";
        std::cout << "NODES: " << tree.node_count() << "\n";
        std::cout << "LEAVES: " << tree.leaf_count() << "\n";
        std::cout << "DEPTH: " << tree.depth() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "inspect failed: " << e.what() << "\n";
        return 1;
    }
}
