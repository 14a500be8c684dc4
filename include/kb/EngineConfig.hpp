#pragma once
#include "cluster/ClusteringEngine.hpp"
#include "search/DuplicateDetector.hpp"
#include "search/VectorIndex.hpp"

#include <string>

namespace kb {

struct EngineConfig {
    search::VectorIndexConfig index;
    cluster::ClusteringConfig clustering;
    search::DuplicateConfig duplicates;
    size_t snippet_chars = 100;
};

// Reads an engine config JSON file. Every key is optional; present keys must
// have the right type:
// {
//   "index":      {"rebuild_threshold": 100},
//   "clustering": {"assign_threshold": 0.5, "name_boost": 0.2, "max_concepts": 5,
//                  "area_threshold": 0.3, "area_concepts": 15, "strong_area_min_docs": 5},
//   "duplicates": {"threshold": 0.85, "limit": 100, "candidates": 20},
//   "snippet_chars": 100
// }
EngineConfig load_engine_config(const std::string& path);

// same, from a JSON string ("where" prefixes error messages)
EngineConfig parse_engine_config(const std::string& json_text, const std::string& where = "config");

}
