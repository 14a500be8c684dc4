#include "commands/ingest.hpp"
#include "commands/common.hpp"

#include "kb/ClusterReport.hpp"

#include <iostream>
#include <string>

int cmd_ingest(int argc, char** argv) {
    try {
        const std::string manifest = get_arg(argc, argv, "--manifest", "");
        const std::string outp     = get_arg(argc, argv, "--out", "out/clusters.json");
        const bool quiet           = has_flag(argc, argv, "--quiet");

        if (manifest.empty()) {
            std::cerr << "error: missing --manifest\n";
            return 1;
        }

        auto kbase = load_knowledge_base(argc, argv, !quiet);

        kb::ClusterReport report;
        report.manifest_path = manifest;
        report.num_documents = kbase->document_count();
        report.vocabulary_size = kbase->vocabulary_size();
        report.clusters = kbase->cluster_snapshot();
        report.areas = kbase->knowledge_areas();

        for (const auto& c : report.clusters) {
            std::cout << "cluster " << c.id << " \"" << c.name << "\" (" << c.document_ids.size() << " docs)";
            if (!c.concepts.empty()) {
                std::cout << ": ";
                for (size_t i = 0; i < c.concepts.size(); ++i) {
                    if (i) std::cout << ", ";
                    std::cout << c.concepts[i];
                }
            }
            std::cout << "\n";
        }

        report.write_to(outp);

        std::cout << "saved: " << outp << " (docs=" << report.num_documents
                  << ", clusters=" << report.clusters.size()
                  << ", vocab=" << report.vocabulary_size << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "ingest failed: " << e.what() << "\n";
        return 1;
    }
}
