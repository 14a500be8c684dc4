#pragma once
#include "kb/Ids.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace cluster {

struct Cluster {
    kb::ClusterId id = 0;
    std::string name;
    std::vector<std::string> concepts;      // case-folded, caller order, at most max_concepts
    std::set<std::string> concept_set;      // same names, sorted, for jaccard
    std::set<kb::DocId> document_ids;
    std::optional<std::string> skill_level;
};

struct ClusteringConfig {
    double assign_threshold = 0.5;  // join an existing cluster if boosted score >= this
    double name_boost = 0.2;        // added when the suggested name equals the cluster name
    size_t max_concepts = 5;        // representative concepts kept per cluster

    // knowledge areas
    double area_threshold = 0.3;
    size_t area_concepts = 15;
    size_t strong_area_min_docs = 5;
};

// group of related clusters
struct KnowledgeArea {
    std::string name;
    std::vector<kb::ClusterId> cluster_ids;
    size_t total_documents = 0;
    std::vector<std::string> core_concepts;
    std::string strength; // "strong" | "emerging"
};

class ClusteringEngine {
public:
    explicit ClusteringEngine(const ClusteringConfig& cfg = {});

    // Best existing cluster for a concept list, or nullopt when no cluster
    // reaches assign_threshold. Never mutates.
    std::optional<kb::ClusterId> match_cluster(const std::vector<std::string>& concepts,
                                               const std::optional<std::string>& suggested_name = std::nullopt) const;

    kb::ClusterId create_cluster(const std::vector<std::string>& concepts,
                                 const std::string& name,
                                 const std::optional<std::string>& skill_level = std::nullopt);

    // match or create, then record membership; moves the document if it was
    // already assigned elsewhere
    kb::ClusterId assign(kb::DocId document_id,
                         const std::vector<std::string>& concepts,
                         const std::optional<std::string>& suggested_name,
                         const std::optional<std::string>& skill_level);

    // no-op if the document is not in any cluster
    void remove_document(kb::DocId document_id);

    void rename_cluster(kb::ClusterId id, const std::string& name);

    const Cluster* find_cluster(kb::ClusterId id) const;
    std::optional<kb::ClusterId> cluster_of(kb::DocId document_id) const;
    const std::map<kb::ClusterId, Cluster>& clusters() const { return m_clusters; }
    size_t size() const { return m_clusters.size(); }

    std::vector<KnowledgeArea> detect_knowledge_areas() const;

    // boosted similarity of a concept list against one cluster
    double score(const std::set<std::string>& doc_concepts,
                 const std::string* folded_name,
                 const Cluster& c) const;

    const ClusteringConfig& config() const { return m_cfg; }

private:
    ClusteringConfig m_cfg;
    std::map<kb::ClusterId, Cluster> m_clusters; // ascending id == creation order
    std::unordered_map<kb::DocId, kb::ClusterId> m_membership;
    kb::ClusterId m_next_id = 0;
};

}
