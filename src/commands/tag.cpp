#include "commands/tag.hpp"
#include "commands/CommandUtil.hpp"

#include "io/JsonIO.hpp"
#include "tagger/ItemTagger.hpp"
#include "tagger/TagsArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

int cmd_tag(int argc, char** argv) {
    try {
        const std::string config_path = get_arg(argc, argv, "--config", "config/tagger.json");
        const std::string catalog_path = get_arg(argc, argv, "--catalog", "data/catalog.json");
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const bool quiet = has_flag(argc, argv, "--quiet");

        tagger::TaggerConfig cfg = loadTaggerConfig(config_path);
        const std::string cache = get_arg(argc, argv, "--cache", cfg.cache_path);

        ProviderStack stack = open_providers(cfg, cache);
        const tagger::ProviderMap providers = stack.view();
        std::vector<tagger::LoadedTaxonomy> taxonomies = build_taxonomies(cfg, providers);

        const std::vector<tagger::CatalogItem> items = loadCatalog(catalog_path);

        tagger::ItemTagger tagger(std::move(taxonomies), providers, cfg.text_fields, cfg.full_text_fields);

        tagger::TagsArtifact artifact;
        artifact.config_path = config_path;
        artifact.catalog_path = catalog_path;
        artifact.num_items = static_cast<int>(items.size());
        artifact.items.reserve(items.size());

        size_t unavailable = 0;
        for (const auto& item : items) {
            tagger::ItemTags t = tagger.tag(item);

            for (const auto& w : t.warnings) {
                std::cerr << "warning: item " << item.id << ": " << w << "\n";
            }
            for (const auto& a : t.assignments) {
                if (!a.available) ++unavailable;
                if (a.stats.skipped > 0) {
                    std::cerr << "warning: item " << item.id << ": " << a.taxonomy << ": skipped "
                              << a.stats.skipped << " comparisons on dimension mismatch\n";
                }
            }

            if (!quiet) std::cout << "tagged " << item.id << "\n";
            artifact.items.push_back(std::move(t));
        }

        const fs::path tags_path = outdir / "tags.json";
        artifact.write_to(tags_path);

        if (!cache.empty() && !save_caches(stack, cache)) {
            std::cerr << "warning: embedding cache not saved\n";
        }

        std::cout << "CONFIG: " << config_path << "\n";
        std::cout << "CATALOG: " << catalog_path << "\n";
        std::cout << "ITEMS: " << artifact.num_items << "\n";
        std::cout << "TAXONOMIES: " << tagger.taxonomies().size() << "\n";
        std::cout << "UNAVAILABLE: " << unavailable << "\n";
        std::cout << "OUT_TAGS: " << tags_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "tag failed: " << e.what() << "\n";
        return 1;
    }
}
