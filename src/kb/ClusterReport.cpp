#include "kb/ClusterReport.hpp"

#include <fstream>
#include <stdexcept>

namespace kb {

static nlohmann::json cluster_to_json(const cluster::Cluster& c) {
    nlohmann::json j;

    j["id"] = c.id;
    j["name"] = c.name;
    j["concepts"] = c.concepts;
    j["document_ids"] = c.document_ids;
    j["doc_count"] = c.document_ids.size();
    if (c.skill_level) j["skill_level"] = *c.skill_level;
    else j["skill_level"] = nullptr;

    return j;
}

static nlohmann::json area_to_json(const cluster::KnowledgeArea& a) {
    return {
        {"name", a.name},
        {"related_clusters", a.cluster_ids},
        {"total_documents", a.total_documents},
        {"core_concepts", a.core_concepts},
        {"strength", a.strength},
    };
}

nlohmann::json ClusterReport::to_json() const {
    nlohmann::json j;
    j["manifest_path"] = manifest_path;
    j["num_documents"] = num_documents;
    j["vocabulary_size"] = vocabulary_size;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : clusters) {
        arr.push_back(cluster_to_json(c));
    }
    j["clusters"] = arr;

    nlohmann::json areas_j = nlohmann::json::array();
    for (const auto& a : areas) {
        areas_j.push_back(area_to_json(a));
    }
    j["knowledge_areas"] = areas_j;

    return j;
}

void ClusterReport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace kb
