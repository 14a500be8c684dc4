#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "cluster/ClusteringEngine.hpp"

namespace kb {

struct ClusterReport {
    std::string manifest_path;
    size_t num_documents = 0;
    size_t vocabulary_size = 0;

    std::vector<cluster::Cluster> clusters;
    std::vector<cluster::KnowledgeArea> areas;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace kb
