#include "search/VectorIndex.hpp"
#include "kb/Errors.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <unordered_set>

namespace search {

static std::string id_str(kb::DocId id) {
    return std::to_string(id);
}

template <typename RowT>
static RowT project_with(const std::vector<std::string>& toks,
                         const std::unordered_map<std::string, uint32_t>& term_to_id,
                         const std::vector<double>& idf) {
    std::unordered_map<uint32_t, uint32_t> tf;
    tf.reserve(toks.size());

    for (const auto& t : toks) {
        auto it = term_to_id.find(t);
        if (it == term_to_id.end()) continue; // out of vocabulary until the next rebuild
        tf[it->second] += 1;
    }

    RowT row;
    row.token_count = toks.size();
    row.weights.reserve(tf.size());

    for (const auto& kv : tf) {
        uint32_t term_id = kv.first;
        uint32_t freq = kv.second;

        // log TF
        double w = (1.0 + std::log((double)freq)) * idf[term_id];
        row.weights.push_back({term_id, w});
    }

    simutil::sort_and_merge(row.weights);
    row.norm = simutil::l2_norm(row.weights);
    return row;
}

VectorIndex::VectorIndex(const VectorIndexConfig& cfg) : m_policy(cfg.rebuild_threshold) {}

VectorIndex::Row VectorIndex::project(const std::vector<std::string>& toks) const {
    return project_with<Row>(toks, m_term_to_id, m_idf);
}

void VectorIndex::reindex_rows_from(size_t first) {
    for (size_t i = first; i < m_id_order.size(); ++i) {
        m_row_of[m_id_order[i]] = i;
    }
}

void VectorIndex::rebuild_all() {
    const size_t N = m_id_order.size();

    // Pass 1: tokens + DF, std::map keeps the vocabulary in sorted order
    std::vector<std::vector<std::string>> doc_tokens;
    doc_tokens.reserve(N);
    std::map<std::string, uint32_t> df_map;

    for (kb::DocId id : m_id_order) {
        auto toks = textutil::terms_of(m_corpus.at(id));

        std::unordered_set<std::string> seen(toks.begin(), toks.end());
        for (const auto& t : seen) df_map[t] += 1;

        doc_tokens.push_back(std::move(toks));
    }

    // Freeze vocab: assign term_ids
    std::vector<std::string> terms;
    std::vector<double> idf;
    std::unordered_map<std::string, uint32_t> term_to_id;
    terms.reserve(df_map.size());
    idf.reserve(df_map.size());
    term_to_id.reserve(df_map.size());

    for (const auto& kv : df_map) {
        term_to_id.emplace(kv.first, (uint32_t)terms.size());
        terms.push_back(kv.first);

        // smooth: idf = log((N + 1)/(df + 1)) + 1
        double df = (double)kv.second;
        idf.push_back(std::log(((double)N + 1.0) / (df + 1.0)) + 1.0);
    }

    // Pass 2: reproject every row
    std::vector<Row> rows;
    rows.reserve(N);
    for (const auto& toks : doc_tokens) {
        rows.push_back(project_with<Row>(toks, term_to_id, idf));
    }

    // commit
    m_terms.swap(terms);
    m_idf.swap(idf);
    m_term_to_id.swap(term_to_id);
    m_rows.swap(rows);
}

void VectorIndex::add(kb::DocId id, const std::string& text) {
    if (contains(id)) {
        throw kb::InvalidArgumentError("document already indexed: " + id_str(id));
    }

    auto toks = textutil::terms_of(text);
    if (toks.empty()) {
        throw kb::EmptyDocumentError("document " + id_str(id) + " has no indexable terms");
    }

    const RebuildMode mode = m_policy.plan_single(m_corpus.empty());

    if (mode == RebuildMode::Incremental) {
        Row row = project(toks);

        m_corpus.emplace(id, text);
        m_id_order.push_back(id);
        m_row_of[id] = m_id_order.size() - 1;
        m_rows.push_back(std::move(row));

        m_policy.mark_incremental();
        return;
    }

    m_corpus.emplace(id, text);
    m_id_order.push_back(id);
    m_row_of[id] = m_id_order.size() - 1;
    m_rows.emplace_back();

    try {
        rebuild_all();
    } catch (...) {
        m_rows.pop_back();
        m_row_of.erase(id);
        m_id_order.pop_back();
        m_corpus.erase(id);
        throw;
    }
    m_policy.mark_rebuilt();
}

void VectorIndex::add_batch(const std::vector<kb::DocId>& ids, const std::vector<std::string>& texts) {
    if (ids.size() != texts.size()) {
        throw kb::InvalidArgumentError("add_batch: ids and texts differ in length");
    }
    if (ids.empty()) return;

    // validate everything before touching the corpus
    std::unordered_set<kb::DocId> batch_ids;
    batch_ids.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        if (contains(ids[i]) || !batch_ids.insert(ids[i]).second) {
            throw kb::InvalidArgumentError("add_batch: duplicate document id " + id_str(ids[i]));
        }
        if (textutil::terms_of(texts[i]).empty()) {
            throw kb::EmptyDocumentError("add_batch: document " + id_str(ids[i]) + " has no indexable terms");
        }
    }

    m_policy.plan_batch();

    const size_t first_new = m_id_order.size();
    for (size_t i = 0; i < ids.size(); ++i) {
        m_corpus.emplace(ids[i], texts[i]);
        m_id_order.push_back(ids[i]);
        m_row_of[ids[i]] = m_id_order.size() - 1;
        m_rows.emplace_back();
    }

    try {
        rebuild_all();
    } catch (...) {
        for (size_t i = 0; i < ids.size(); ++i) {
            m_corpus.erase(ids[i]);
            m_row_of.erase(ids[i]);
        }
        m_id_order.resize(first_new);
        m_rows.resize(first_new);
        throw;
    }
    m_policy.mark_rebuilt();
}

void VectorIndex::remove(kb::DocId id) {
    auto it = m_row_of.find(id);
    if (it == m_row_of.end()) {
        throw kb::NotFoundError("document not indexed: " + id_str(id));
    }

    // vocabulary is left as is; unused terms go away on the next rebuild
    const size_t row = it->second;
    m_row_of.erase(it);
    m_corpus.erase(id);
    m_id_order.erase(m_id_order.begin() + (std::ptrdiff_t)row);
    m_rows.erase(m_rows.begin() + (std::ptrdiff_t)row);
    reindex_rows_from(row);
}

void VectorIndex::update(kb::DocId id, const std::string& text) {
    auto it = m_row_of.find(id);
    if (it == m_row_of.end()) {
        throw kb::NotFoundError("document not indexed: " + id_str(id));
    }

    auto toks = textutil::terms_of(text);
    if (toks.empty()) {
        throw kb::EmptyDocumentError("document " + id_str(id) + " has no indexable terms");
    }

    const size_t row = it->second;
    const RebuildMode mode = m_policy.plan_single(false);

    if (mode == RebuildMode::Incremental) {
        Row r = project(toks);
        m_corpus[id] = text;
        m_rows[row] = std::move(r);
        m_policy.mark_incremental();
        return;
    }

    std::string old_text = text;
    m_corpus[id].swap(old_text);
    try {
        rebuild_all();
    } catch (...) {
        m_corpus[id].swap(old_text);
        throw;
    }
    m_policy.mark_rebuilt();
}

void VectorIndex::rebuild() {
    m_policy.request_rebuild();
    rebuild_all();
    m_policy.mark_rebuilt();
}

const std::string& VectorIndex::text(kb::DocId id) const {
    auto it = m_corpus.find(id);
    if (it == m_corpus.end()) {
        throw kb::NotFoundError("document not indexed: " + id_str(id));
    }
    return it->second;
}

std::vector<SearchHit> VectorIndex::rank(const Row& query, size_t top_k,
                                         const std::unordered_set<kb::DocId>* allowed_ids,
                                         const kb::DocId* exclude) const {
    std::vector<SearchHit> hits;
    hits.reserve(allowed_ids ? std::min(allowed_ids->size(), m_rows.size()) : m_rows.size());

    for (size_t i = 0; i < m_rows.size(); ++i) {
        const kb::DocId id = m_id_order[i];
        if (exclude && id == *exclude) continue;
        if (allowed_ids && allowed_ids->find(id) == allowed_ids->end()) continue;

        const Row& r = m_rows[i];
        double score = simutil::cosine_sparse(query.weights, query.norm, r.weights, r.norm);
        hits.push_back({id, score, r.token_count});
    }

    const size_t k = std::min(top_k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + (std::ptrdiff_t)k, hits.end(),
                      [](const SearchHit& a, const SearchHit& b){
                          return simutil::ranks_before(a.score, a.doc_id, b.score, b.doc_id);
                      });

    hits.resize(k);
    return hits;
}

std::vector<SearchHit> VectorIndex::search(const std::string& query,
                                           size_t top_k,
                                           const std::unordered_set<kb::DocId>* allowed_ids) const {
    if (top_k < 1) {
        throw kb::InvalidArgumentError("search: top_k must be >= 1");
    }

    auto qtoks = textutil::terms_of(query);

    // an empty filter admits nothing, with or without a query
    if (allowed_ids && allowed_ids->empty()) return {};

    if (qtoks.empty()) {
        throw kb::EmptyQueryError("search: query has no usable terms");
    }

    // out-of-vocabulary query terms are dropped; they never trigger a rebuild
    Row q = project(qtoks);
    return rank(q, top_k, allowed_ids, nullptr);
}

std::vector<SearchHit> VectorIndex::similar_to(kb::DocId id, size_t top_k) const {
    if (top_k < 1) {
        throw kb::InvalidArgumentError("similar_to: top_k must be >= 1");
    }

    auto it = m_row_of.find(id);
    if (it == m_row_of.end()) {
        throw kb::NotFoundError("document not indexed: " + id_str(id));
    }

    return rank(m_rows[it->second], top_k, nullptr, &id);
}

}
