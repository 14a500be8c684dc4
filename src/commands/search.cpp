#include "commands/search.hpp"
#include "commands/common.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

static void print_hits(const std::vector<kb::KbHit>& hits, double min_score) {
    size_t rank = 0;
    for (const auto& h : hits) {
        // zero-score rows come back from the index; hide them below min_score
        if (h.score < min_score) continue;

        ++rank;
        std::cout << rank << ". doc " << h.doc_id
                  << "  score=" << std::fixed << std::setprecision(4) << h.score
                  << "  cluster=";
        if (h.cluster_id) std::cout << *h.cluster_id;
        else std::cout << "-";
        std::cout << "\n   " << h.snippet << "\n";
    }
    if (rank == 0) std::cout << "no results\n";
}

int cmd_search(int argc, char** argv) {
    try {
        const std::string query   = get_arg(argc, argv, "--query", "");
        const std::string doc     = get_arg(argc, argv, "--doc", "");
        const size_t topk         = get_size_arg(argc, argv, "--topk", 5);
        const double min_score    = get_double_arg(argc, argv, "--min_score", 0.01);

        if (query.empty() && doc.empty()) {
            std::cerr << "error: missing --query (or --doc)\n";
            return 1;
        }

        std::optional<kb::ClusterId> cluster;
        if (has_flag(argc, argv, "--cluster")) cluster = get_size_arg(argc, argv, "--cluster", 0);

        auto kbase = load_knowledge_base(argc, argv, false);

        if (!doc.empty()) {
            const kb::DocId id = get_size_arg(argc, argv, "--doc", 0);
            std::cout << "similar to doc " << id << ":\n";
            print_hits(kbase->similar_to(id, topk), min_score);
            return 0;
        }

        print_hits(kbase->search(query, topk, cluster), min_score);
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "search failed: " << e.what() << "\n";
        return 1;
    }
}
