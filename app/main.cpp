#include "commands/embed.hpp"
#include "commands/inspect.hpp"
#include "commands/tag.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  catalog-tagger embed [args]\n"
        << "  catalog-tagger tag [args]\n"
        << "  catalog-tagger inspect [args]\n"
        << "  catalog-tagger help\n";
    return 1;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  catalog-tagger embed [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              default: config/tagger.json\n"
        << "  --out <path>                 default: \"cache\" from the config\n"
        << "                               one file per provider: <stem>.<provider><ext>\n";
    return 0;
}

static int print_tag_help() {
    std::cerr
        << "usage:\n"
        << "  catalog-tagger tag [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --config <path>              default: config/tagger.json\n"
        << "  --catalog <path>             default: data/catalog.json\n"
        << "  --outdir <dir>               default: out (writes tags.json)\n"
        << "  --cache <path>               default: \"cache\" from the config\n"
        << "  --quiet                      no per-item progress lines\n";
    return 0;
}

static int print_inspect_help() {
    std::cerr
        << "usage:\n"
        << "  catalog-tagger inspect --taxonomy <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --taxonomy <path>            (required)\n"
        << "  --policy <label|path>        default: label\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    if (cmd == "embed"   && (argc >= 3 && std::string(argv[2]) == "--help")) return print_embed_help();
    if (cmd == "tag"     && (argc >= 3 && std::string(argv[2]) == "--help")) return print_tag_help();
    if (cmd == "inspect" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_inspect_help();

    if (cmd == "embed")   return cmd_embed(argc - 1, argv + 1);
    if (cmd == "tag")     return cmd_tag(argc - 1, argv + 1);
    if (cmd == "inspect") return cmd_inspect(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
