#pragma once
#include "kb/Ids.hpp"
#include "search/VectorIndex.hpp"

#include <vector>

namespace search {

struct DuplicateConfig {
    double threshold = 0.85;  // minimum cosine to call two documents duplicates
    size_t limit = 100;       // max groups returned
    size_t candidates = 20;   // neighbours inspected per document
};

struct DuplicateMatch {
    kb::DocId doc_id = 0;
    double similarity = 0.0;
};

struct DuplicateGroup {
    kb::DocId primary = 0;
    std::vector<DuplicateMatch> duplicates;
    size_t group_size() const { return duplicates.size() + 1; }
};

class DuplicateDetector {
public:
    explicit DuplicateDetector(const VectorIndex& index) : m_index(index) {}

    // groups in descending size; each document appears in at most one group
    std::vector<DuplicateGroup> find_duplicates(const DuplicateConfig& cfg = {}) const;

private:
    const VectorIndex& m_index;
};

}
