#include "search/DuplicateDetector.hpp"
#include "kb/Errors.hpp"

#include <algorithm>
#include <unordered_set>

namespace search {

std::vector<DuplicateGroup> DuplicateDetector::find_duplicates(const DuplicateConfig& cfg) const {
    if (cfg.threshold < 0.0 || cfg.threshold > 1.0) {
        throw kb::InvalidArgumentError("duplicates: threshold must be in [0,1]");
    }
    if (cfg.candidates == 0) {
        throw kb::InvalidArgumentError("duplicates: candidates must be >= 1");
    }

    std::vector<DuplicateGroup> groups;
    if (m_index.size() < 2 || cfg.limit == 0) return groups;

    std::unordered_set<kb::DocId> grouped;
    const size_t k = std::min(cfg.candidates, m_index.size());

    for (kb::DocId id : m_index.ids()) {
        if (grouped.count(id)) continue;

        DuplicateGroup g;
        g.primary = id;

        for (const auto& hit : m_index.similar_to(id, k)) {
            if (hit.score < cfg.threshold) break; // hits are sorted by score
            if (grouped.count(hit.doc_id)) continue;
            g.duplicates.push_back({hit.doc_id, hit.score});
            grouped.insert(hit.doc_id);
        }

        if (g.duplicates.empty()) continue;

        grouped.insert(id);
        groups.push_back(std::move(g));
        if (groups.size() >= cfg.limit) break;
    }

    // largest groups first
    std::stable_sort(groups.begin(), groups.end(), [](const DuplicateGroup& a, const DuplicateGroup& b){
        return a.group_size() > b.group_size();
    });
    return groups;
}

}
