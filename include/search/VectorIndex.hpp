#pragma once
#include "kb/Ids.hpp"
#include "search/RebuildPolicy.hpp"
#include "util/Similarity.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace search {

struct SearchHit {
    kb::DocId doc_id = 0;
    double score = 0.0;
    size_t token_count = 0;
};

struct VectorIndexConfig {
    size_t rebuild_threshold = 100; // mutations between forced vocabulary rebuilds
};

// In-memory TF-IDF index over caller-identified documents.
//
// Not internally synchronized: callers hold an exclusive lock for every
// mutating call and a shared lock for search/similar_to (see kb::KnowledgeBase).
class VectorIndex {
public:
    explicit VectorIndex(const VectorIndexConfig& cfg = {});

    // Throws InvalidArgumentError for a duplicate id, EmptyDocumentError when
    // text has no usable tokens.
    void add(kb::DocId id, const std::string& text);

    // All items are validated before anything is inserted; one rebuild total.
    void add_batch(const std::vector<kb::DocId>& ids, const std::vector<std::string>& texts);

    void remove(kb::DocId id);

    // keeps the document's insertion slot
    void update(kb::DocId id, const std::string& text);

    // allowed_ids == nullptr means "no filter"
    std::vector<SearchHit> search(const std::string& query,
                                  size_t top_k,
                                  const std::unordered_set<kb::DocId>* allowed_ids = nullptr) const;

    // neighbours of an indexed document, the document itself excluded
    std::vector<SearchHit> similar_to(kb::DocId id, size_t top_k) const;

    // re-derive vocabulary and reproject every row now
    void rebuild();

    bool contains(kb::DocId id) const { return m_corpus.find(id) != m_corpus.end(); }
    const std::string& text(kb::DocId id) const;
    size_t size() const { return m_id_order.size(); }
    const std::vector<kb::DocId>& ids() const { return m_id_order; }
    size_t vocabulary_size() const { return m_terms.size(); }
    bool has_term(const std::string& term) const { return m_term_to_id.count(term) != 0; }

    RebuildMode mode() const { return m_policy.mode(); }
    size_t pending_ops() const { return m_policy.pending_ops(); }

private:
    struct Row {
        size_t token_count = 0;
        simutil::SparseRow weights; // (term_id, tf-idf weight)
        double norm = 0.0;
    };

    // corpus + row order
    std::unordered_map<kb::DocId, std::string> m_corpus;
    std::vector<kb::DocId> m_id_order;                    // row i <-> m_id_order[i]
    std::unordered_map<kb::DocId, size_t> m_row_of;       // id -> row index
    std::vector<Row> m_rows;

    // vocab (sorted term order, frozen between rebuilds)
    std::vector<std::string> m_terms;                     // term_id -> term
    std::vector<double> m_idf;                            // term_id -> idf
    std::unordered_map<std::string, uint32_t> m_term_to_id;

    RebuildPolicy m_policy;

    Row project(const std::vector<std::string>& toks) const;
    void rebuild_all();
    void reindex_rows_from(size_t first);

    std::vector<SearchHit> rank(const Row& query, size_t top_k,
                                const std::unordered_set<kb::DocId>* allowed_ids,
                                const kb::DocId* exclude) const;
};

}
