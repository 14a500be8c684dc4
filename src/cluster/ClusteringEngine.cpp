#include "cluster/ClusteringEngine.hpp"
#include "kb/Errors.hpp"
#include "util/Similarity.hpp"
#include "util/TextUtil.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace cluster {

// absorbs rounding in sums like 0.3 + 0.2
static constexpr double kScoreEpsilon = 1e-9;

static std::set<std::string> to_set(const std::vector<std::string>& folded) {
    return std::set<std::string>(folded.begin(), folded.end());
}

ClusteringEngine::ClusteringEngine(const ClusteringConfig& cfg) : m_cfg(cfg) {
    if (cfg.assign_threshold <= 0.0) {
        throw kb::InvalidArgumentError("clustering: assign_threshold must be > 0");
    }
    if (cfg.name_boost < 0.0) {
        throw kb::InvalidArgumentError("clustering: name_boost must be >= 0");
    }
    if (cfg.max_concepts == 0) {
        throw kb::InvalidArgumentError("clustering: max_concepts must be >= 1");
    }
}

double ClusteringEngine::score(const std::set<std::string>& doc_concepts,
                               const std::string* folded_name,
                               const Cluster& c) const {
    double s = simutil::jaccard(doc_concepts, c.concept_set);
    if (folded_name && !folded_name->empty() && *folded_name == textutil::fold_concept(c.name)) {
        s += m_cfg.name_boost;
    }
    return s;
}

std::optional<kb::ClusterId> ClusteringEngine::match_cluster(const std::vector<std::string>& concepts,
                                                             const std::optional<std::string>& suggested_name) const {
    if (m_clusters.empty()) return std::nullopt;

    // full concept list, no truncation while matching
    const std::set<std::string> doc_set = to_set(textutil::fold_concepts(concepts));

    // nothing to compare: always a fresh cluster
    if (doc_set.empty()) return std::nullopt;

    std::string folded_name;
    if (suggested_name) folded_name = textutil::fold_concept(*suggested_name);

    std::optional<kb::ClusterId> best;
    double best_score = 0.0;

    // ascending id; strict '>' keeps the oldest cluster on ties
    for (const auto& kv : m_clusters) {
        double s = score(doc_set, suggested_name ? &folded_name : nullptr, kv.second);
        if (!best || s > best_score) {
            best = kv.first;
            best_score = s;
        }
    }

    if (best && best_score + kScoreEpsilon >= m_cfg.assign_threshold) return best;
    return std::nullopt;
}

kb::ClusterId ClusteringEngine::create_cluster(const std::vector<std::string>& concepts,
                                               const std::string& name,
                                               const std::optional<std::string>& skill_level) {
    std::vector<std::string> folded = textutil::fold_concepts(concepts);

    // caller order is "most relevant first"; no re-ranking here
    if (folded.size() > m_cfg.max_concepts) folded.resize(m_cfg.max_concepts);

    Cluster c;
    c.id = m_next_id++;
    c.name = name;
    if (c.name.empty()) {
        c.name = !folded.empty() ? folded.front() : "Cluster " + std::to_string(c.id);
    }
    c.concept_set = to_set(folded);
    c.concepts = std::move(folded);
    c.skill_level = skill_level;

    const kb::ClusterId id = c.id;
    m_clusters.emplace(id, std::move(c));
    return id;
}

kb::ClusterId ClusteringEngine::assign(kb::DocId document_id,
                                       const std::vector<std::string>& concepts,
                                       const std::optional<std::string>& suggested_name,
                                       const std::optional<std::string>& skill_level) {
    std::optional<kb::ClusterId> hit = match_cluster(concepts, suggested_name);

    kb::ClusterId id = 0;
    if (hit) {
        id = *hit;
    } else {
        id = create_cluster(concepts, suggested_name.value_or(""), skill_level);
    }

    // target is settled; only now move the membership
    auto [slot, fresh] = m_membership.try_emplace(document_id, id);
    try {
        m_clusters.at(id).document_ids.insert(document_id);
    } catch (...) {
        if (fresh) m_membership.erase(slot);
        throw;
    }

    if (!fresh && slot->second != id) {
        auto old = m_clusters.find(slot->second);
        if (old != m_clusters.end()) old->second.document_ids.erase(document_id);
        slot->second = id;
    }
    return id;
}

void ClusteringEngine::remove_document(kb::DocId document_id) {
    auto it = m_membership.find(document_id);
    if (it == m_membership.end()) return;

    auto c = m_clusters.find(it->second);
    if (c != m_clusters.end()) c->second.document_ids.erase(document_id);
    m_membership.erase(it);
}

void ClusteringEngine::rename_cluster(kb::ClusterId id, const std::string& name) {
    auto it = m_clusters.find(id);
    if (it == m_clusters.end()) {
        throw kb::NotFoundError("cluster not found: " + std::to_string(id));
    }
    if (textutil::fold_concept(name).empty()) {
        throw kb::InvalidArgumentError("cluster name must not be empty");
    }
    it->second.name = name;
}

const Cluster* ClusteringEngine::find_cluster(kb::ClusterId id) const {
    auto it = m_clusters.find(id);
    if (it == m_clusters.end()) return nullptr;
    return &it->second;
}

std::optional<kb::ClusterId> ClusteringEngine::cluster_of(kb::DocId document_id) const {
    auto it = m_membership.find(document_id);
    if (it == m_membership.end()) return std::nullopt;
    return it->second;
}

std::vector<KnowledgeArea> ClusteringEngine::detect_knowledge_areas() const {
    std::vector<KnowledgeArea> areas;
    std::unordered_set<kb::ClusterId> processed;

    for (const auto& [seed_id, seed] : m_clusters) {
        if (processed.count(seed_id)) continue;
        processed.insert(seed_id);

        KnowledgeArea area;
        area.name = seed.name;
        area.cluster_ids.push_back(seed_id);

        for (const auto& [other_id, other] : m_clusters) {
            if (processed.count(other_id)) continue;
            double sim = simutil::jaccard(seed.concept_set, other.concept_set);
            if (sim + kScoreEpsilon >= m_cfg.area_threshold) {
                area.cluster_ids.push_back(other_id);
                processed.insert(other_id);
            }
        }

        // concept frequency over member clusters, ties -> first seen
        std::vector<std::string> order;
        std::unordered_map<std::string, size_t> freq;
        for (kb::ClusterId cid : area.cluster_ids) {
            const Cluster& c = m_clusters.at(cid);
            area.total_documents += c.document_ids.size();
            for (const auto& name : c.concepts) {
                if (freq[name]++ == 0) order.push_back(name);
            }
        }

        std::stable_sort(order.begin(), order.end(), [&](const std::string& a, const std::string& b){
            return freq.at(a) > freq.at(b);
        });
        if (order.size() > m_cfg.area_concepts) order.resize(m_cfg.area_concepts);
        area.core_concepts = std::move(order);

        area.strength = area.total_documents >= m_cfg.strong_area_min_docs ? "strong" : "emerging";
        areas.push_back(std::move(area));
    }

    return areas;
}

}
