#include "kb/EngineConfig.hpp"
#include "io/JsonChecks.hpp"

using jsoncheck::json;

namespace kb {

// absent section -> nullptr, present but not an object -> error
static const json* section(const json& root, const char* key, const std::string& where) {
    if (!root.contains(key)) return nullptr;
    const json& s = root.at(key);
    jsoncheck::expect_object(s, jsoncheck::at_key(where, key));
    return &s;
}

EngineConfig parse_engine_config(const std::string& json_text, const std::string& where) {
    const json j = jsoncheck::parse(json_text, where);
    jsoncheck::expect_object(j, where);

    EngineConfig cfg;

    if (const json* ij = section(j, "index", where)) {
        const std::string w = jsoncheck::at_key(where, "index");
        jsoncheck::opt_size(*ij, "rebuild_threshold", w, cfg.index.rebuild_threshold);
    }

    if (const json* cj = section(j, "clustering", where)) {
        const std::string w = jsoncheck::at_key(where, "clustering");
        auto& c = cfg.clustering;
        jsoncheck::opt_number(*cj, "assign_threshold", w, c.assign_threshold);
        jsoncheck::opt_number(*cj, "name_boost", w, c.name_boost);
        jsoncheck::opt_size(*cj, "max_concepts", w, c.max_concepts);
        jsoncheck::opt_number(*cj, "area_threshold", w, c.area_threshold);
        jsoncheck::opt_size(*cj, "area_concepts", w, c.area_concepts);
        jsoncheck::opt_size(*cj, "strong_area_min_docs", w, c.strong_area_min_docs);
    }

    if (const json* dj = section(j, "duplicates", where)) {
        const std::string w = jsoncheck::at_key(where, "duplicates");
        jsoncheck::opt_number(*dj, "threshold", w, cfg.duplicates.threshold);
        jsoncheck::opt_size(*dj, "limit", w, cfg.duplicates.limit);
        jsoncheck::opt_size(*dj, "candidates", w, cfg.duplicates.candidates);
    }

    jsoncheck::opt_size(j, "snippet_chars", where, cfg.snippet_chars);
    return cfg;
}

EngineConfig load_engine_config(const std::string& path) {
    return parse_engine_config(jsoncheck::read_file(path, "config"), path);
}

}
