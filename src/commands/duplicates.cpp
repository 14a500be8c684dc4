#include "commands/duplicates.hpp"
#include "commands/common.hpp"

#include <iomanip>
#include <iostream>
#include <string>

int cmd_duplicates(int argc, char** argv) {
    try {
        auto kbase = load_knowledge_base(argc, argv, false);

        const auto groups = kbase->find_duplicates();
        if (groups.empty()) {
            std::cout << "no duplicates at threshold " << kbase->config().duplicates.threshold << "\n";
            return 0;
        }

        for (const auto& g : groups) {
            std::cout << "doc " << g.primary << " (group of " << g.group_size() << ")\n";
            for (const auto& d : g.duplicates) {
                std::cout << "  ~ doc " << d.doc_id
                          << "  similarity=" << std::fixed << std::setprecision(4) << d.similarity << "\n";
            }
        }
        std::cout << "groups: " << groups.size() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "duplicates failed: " << e.what() << "\n";
        return 1;
    }
}
