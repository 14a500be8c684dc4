#include "commands/areas.hpp"
#include "commands/common.hpp"

#include <iostream>
#include <string>

int cmd_areas(int argc, char** argv) {
    try {
        auto kbase = load_knowledge_base(argc, argv, false);

        const auto areas = kbase->knowledge_areas();
        for (const auto& a : areas) {
            std::cout << a.name << " [" << a.strength << "] docs=" << a.total_documents << " clusters=";
            for (size_t i = 0; i < a.cluster_ids.size(); ++i) {
                if (i) std::cout << ",";
                std::cout << a.cluster_ids[i];
            }
            std::cout << "\n";

            if (!a.core_concepts.empty()) {
                std::cout << "  ";
                for (size_t i = 0; i < a.core_concepts.size(); ++i) {
                    if (i) std::cout << ", ";
                    std::cout << a.core_concepts[i];
                }
                std::cout << "\n";
            }
        }
        std::cout << "areas: " << areas.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "areas failed: " << e.what() << "\n";
        return 1;
    }
}
