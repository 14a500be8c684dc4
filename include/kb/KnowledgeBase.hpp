#pragma once
#include "cluster/ClusteringEngine.hpp"
#include "kb/EngineConfig.hpp"
#include "kb/Ids.hpp"
#include "search/DuplicateDetector.hpp"
#include "search/VectorIndex.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace kb {

struct IngestRequest {
    DocId id = 0;
    std::string text;
    std::vector<std::string> concepts;          // most relevant first
    std::optional<std::string> suggested_name;
    std::optional<std::string> skill_level;
};

struct KbHit {
    DocId doc_id = 0;
    double score = 0.0;
    size_t token_count = 0;
    std::optional<ClusterId> cluster_id;
    std::string snippet;
};

// Owns one VectorIndex and one ClusteringEngine and applies the
// single-writer / multiple-reader discipline: mutations take the exclusive
// lock, queries the shared one. The two components stay unaware of each other.
class KnowledgeBase {
public:
    explicit KnowledgeBase(const EngineConfig& cfg = {});

    // indexes first, clusters second; a rejected document is not clustered
    ClusterId ingest(const IngestRequest& req);

    // One index rebuild, then clustering in request order. All or nothing:
    // if clustering fails part way, every document of the batch is taken back
    // out of the index and out of its cluster.
    std::vector<ClusterId> ingest_batch(const std::vector<IngestRequest>& reqs);

    void update_text(DocId id, const std::string& text);
    void remove(DocId id);

    std::vector<KbHit> search(const std::string& query, size_t top_k,
                              std::optional<ClusterId> cluster = std::nullopt) const;
    std::vector<KbHit> similar_to(DocId id, size_t top_k) const;

    std::optional<ClusterId> match_cluster(const std::vector<std::string>& concepts,
                                           const std::optional<std::string>& suggested_name = std::nullopt) const;
    void rename_cluster(ClusterId id, const std::string& name);

    std::vector<search::DuplicateGroup> find_duplicates() const;
    std::vector<search::DuplicateGroup> find_duplicates(const search::DuplicateConfig& cfg) const;

    std::vector<cluster::KnowledgeArea> knowledge_areas() const;

    // copies, taken under the shared lock
    std::vector<cluster::Cluster> cluster_snapshot() const;
    std::optional<ClusterId> cluster_of(DocId id) const;

    size_t document_count() const;
    size_t vocabulary_size() const;

    const EngineConfig& config() const { return m_cfg; }

private:
    EngineConfig m_cfg;
    mutable std::shared_mutex m_mu;
    search::VectorIndex m_index;
    cluster::ClusteringEngine m_clusters;

    std::vector<KbHit> decorate(const std::vector<search::SearchHit>& hits) const;
};

}
