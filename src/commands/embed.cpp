#include "commands/embed.hpp"
#include "commands/CommandUtil.hpp"
#include "io/JsonIO.hpp"
#include <iostream>
#include <string>

int cmd_embed(int argc, char** argv) {
    try {
        const std::string config_path = get_arg(argc, argv, "--config", "config/tagger.json");

        tagger::TaggerConfig cfg = loadTaggerConfig(config_path);
        const std::string cache = get_arg(argc, argv, "--out", cfg.cache_path);
        if (cache.empty()) {
            std::cerr << "error: no cache path (set \"cache\" in the config or pass --out)\n";
            return 1;
        }

        ProviderStack stack = open_providers(cfg, cache);
        const auto taxonomies = build_taxonomies(cfg, stack.view());

        for (const auto& kv : stack.cached) {
            std::cout << "provider " << emb::provider_kind_str(kv.first)
                      << ": cache hits=" << kv.second->hits() << " misses=" << kv.second->misses() << "\n";
        }

        if (!save_caches(stack, cache)) return 1;

        std::cout << "taxonomies: " << taxonomies.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "embed failed: " << e.what() << "\n";
        return 1;
    }
}
