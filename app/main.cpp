#include "commands/areas.hpp"
#include "commands/duplicates.hpp"
#include "commands/ingest.hpp"
#include "commands/search.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  knowledge-engine ingest [args]\n"
        << "  knowledge-engine search [args]\n"
        << "  knowledge-engine duplicates [args]\n"
        << "  knowledge-engine areas [args]\n"
        << "  knowledge-engine help\n"
        << "\n"
        << "run '<command> --help' for options\n";
    return 1;
}

static void print_common_options() {
    std::cerr
        << "corpus:\n"
        << "  --manifest <path>            (required) JSON manifest of documents\n"
        << "  --concepts <dir>             mock concept files <dir>/<key>.json\n"
        << "  --incremental                ingest one document at a time instead of one batch\n"
        << "\n"
        << "engine:\n"
        << "  --config <path>              JSON engine config (flags below override it)\n"
        << "  --rebuild_every <n>          default: 100\n"
        << "  --assign_threshold <f>       default: 0.5\n"
        << "  --name_boost <f>             default: 0.2\n"
        << "  --max_concepts <n>           default: 5\n"
        << "  --area_threshold <f>         default: 0.3\n"
        << "  --snippet <n>                default: 100\n";
}

static int print_ingest_help() {
    std::cerr
        << "usage:\n"
        << "  knowledge-engine ingest --manifest <path> [options]\n"
        << "\n"
        << "output:\n"
        << "  --out <path>                 default: out/clusters.json\n"
        << "  --quiet                      do not print per-document assignments\n"
        << "\n";
    print_common_options();
    return 0;
}

static int print_search_help() {
    std::cerr
        << "usage:\n"
        << "  knowledge-engine search --manifest <path> --query \"<text>\" [options]\n"
        << "  knowledge-engine search --manifest <path> --doc <id> [options]\n"
        << "\n"
        << "search:\n"
        << "  --query <str>                free-text query\n"
        << "  --doc <id>                   documents similar to an indexed document\n"
        << "  --topk <n>                   default: 5\n"
        << "  --min_score <f>              default: 0.01\n"
        << "  --cluster <id>               restrict to one cluster's documents\n"
        << "\n";
    print_common_options();
    return 0;
}

static int print_duplicates_help() {
    std::cerr
        << "usage:\n"
        << "  knowledge-engine duplicates --manifest <path> [options]\n"
        << "\n"
        << "duplicates:\n"
        << "  --threshold <f>              default: 0.85\n"
        << "  --limit <n>                  default: 100\n"
        << "\n";
    print_common_options();
    return 0;
}

static int print_areas_help() {
    std::cerr
        << "usage:\n"
        << "  knowledge-engine areas --manifest <path> [options]\n"
        << "\n";
    print_common_options();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "ingest"     && help) return print_ingest_help();
    if (cmd == "search"     && help) return print_search_help();
    if (cmd == "duplicates" && help) return print_duplicates_help();
    if (cmd == "areas"      && help) return print_areas_help();

    if (cmd == "ingest")     return cmd_ingest(argc - 1, argv + 1);
    if (cmd == "search")     return cmd_search(argc - 1, argv + 1);
    if (cmd == "duplicates") return cmd_duplicates(argc - 1, argv + 1);
    if (cmd == "areas")      return cmd_areas(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
