#include "kb/KnowledgeBase.hpp"
#include "kb/Errors.hpp"
#include "util/TextUtil.hpp"

#include <mutex>
#include <unordered_set>

namespace kb {

KnowledgeBase::KnowledgeBase(const EngineConfig& cfg)
    : m_cfg(cfg), m_index(cfg.index), m_clusters(cfg.clustering) {}

ClusterId KnowledgeBase::ingest(const IngestRequest& req) {
    std::unique_lock lk(m_mu);

    m_index.add(req.id, req.text);
    try {
        return m_clusters.assign(req.id, req.concepts, req.suggested_name, req.skill_level);
    } catch (...) {
        m_index.remove(req.id);
        throw;
    }
}

std::vector<ClusterId> KnowledgeBase::ingest_batch(const std::vector<IngestRequest>& reqs) {
    std::unique_lock lk(m_mu);

    std::vector<DocId> ids;
    std::vector<std::string> texts;
    ids.reserve(reqs.size());
    texts.reserve(reqs.size());
    for (const auto& r : reqs) {
        ids.push_back(r.id);
        texts.push_back(r.text);
    }

    m_index.add_batch(ids, texts);

    std::vector<ClusterId> out;
    try {
        out.reserve(reqs.size());
        for (const auto& r : reqs) {
            out.push_back(m_clusters.assign(r.id, r.concepts, r.suggested_name, r.skill_level));
        }
    } catch (...) {
        // back out the whole batch; clusters created on the way stay, empty
        for (const auto& r : reqs) {
            m_clusters.remove_document(r.id);
            m_index.remove(r.id);
        }
        throw;
    }
    return out;
}

void KnowledgeBase::update_text(DocId id, const std::string& text) {
    std::unique_lock lk(m_mu);
    m_index.update(id, text);
}

void KnowledgeBase::remove(DocId id) {
    std::unique_lock lk(m_mu);
    m_index.remove(id);
    m_clusters.remove_document(id);
}

std::vector<KbHit> KnowledgeBase::decorate(const std::vector<search::SearchHit>& hits) const {
    std::vector<KbHit> out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        KbHit k;
        k.doc_id = h.doc_id;
        k.score = h.score;
        k.token_count = h.token_count;
        k.cluster_id = m_clusters.cluster_of(h.doc_id);
        k.snippet = textutil::snippet(m_index.text(h.doc_id), m_cfg.snippet_chars);
        out.push_back(std::move(k));
    }
    return out;
}

std::vector<KbHit> KnowledgeBase::search(const std::string& query, size_t top_k,
                                         std::optional<ClusterId> cluster) const {
    std::shared_lock lk(m_mu);

    if (!cluster) return decorate(m_index.search(query, top_k));

    const cluster::Cluster* c = m_clusters.find_cluster(*cluster);
    if (!c) throw NotFoundError("cluster not found: " + std::to_string(*cluster));

    const std::unordered_set<DocId> allowed(c->document_ids.begin(), c->document_ids.end());
    return decorate(m_index.search(query, top_k, &allowed));
}

std::vector<KbHit> KnowledgeBase::similar_to(DocId id, size_t top_k) const {
    std::shared_lock lk(m_mu);
    return decorate(m_index.similar_to(id, top_k));
}

std::optional<ClusterId> KnowledgeBase::match_cluster(const std::vector<std::string>& concepts,
                                                      const std::optional<std::string>& suggested_name) const {
    std::shared_lock lk(m_mu);
    return m_clusters.match_cluster(concepts, suggested_name);
}

void KnowledgeBase::rename_cluster(ClusterId id, const std::string& name) {
    std::unique_lock lk(m_mu);
    m_clusters.rename_cluster(id, name);
}

std::vector<search::DuplicateGroup> KnowledgeBase::find_duplicates() const {
    return find_duplicates(m_cfg.duplicates);
}

std::vector<search::DuplicateGroup> KnowledgeBase::find_duplicates(const search::DuplicateConfig& cfg) const {
    std::shared_lock lk(m_mu);
    return search::DuplicateDetector(m_index).find_duplicates(cfg);
}

std::vector<cluster::KnowledgeArea> KnowledgeBase::knowledge_areas() const {
    std::shared_lock lk(m_mu);
    return m_clusters.detect_knowledge_areas();
}

std::vector<cluster::Cluster> KnowledgeBase::cluster_snapshot() const {
    std::shared_lock lk(m_mu);
    std::vector<cluster::Cluster> out;
    out.reserve(m_clusters.size());
    for (const auto& kv : m_clusters.clusters()) out.push_back(kv.second);
    return out;
}

std::optional<ClusterId> KnowledgeBase::cluster_of(DocId id) const {
    std::shared_lock lk(m_mu);
    return m_clusters.cluster_of(id);
}

size_t KnowledgeBase::document_count() const {
    std::shared_lock lk(m_mu);
    return m_index.size();
}

size_t KnowledgeBase::vocabulary_size() const {
    std::shared_lock lk(m_mu);
    return m_index.vocabulary_size();
}

}
