#include "commands/common.hpp"

#include "concepts/ConceptExtractor.hpp"
#include "concepts/MockConceptExtractor.hpp"
#include "io/JsonIO.hpp"

#include <iostream>
#include <stdexcept>

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

size_t get_size_arg(int argc, char** argv, const std::string& key, size_t def) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return def;

    size_t pos = 0;
    unsigned long long n = 0;
    try {
        n = std::stoull(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a non-negative integer, got '" + v + "'");
    }
    if (pos != v.size() || v[0] == '-') {
        throw std::runtime_error(key + " expects a non-negative integer, got '" + v + "'");
    }
    return (size_t)n;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return def;

    size_t pos = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects a number, got '" + v + "'");
    }
    if (pos != v.size()) {
        throw std::runtime_error(key + " expects a number, got '" + v + "'");
    }
    return d;
}

kb::EngineConfig config_from_args(int argc, char** argv) {
    const std::string config_path = get_arg(argc, argv, "--config", "");
    kb::EngineConfig cfg = config_path.empty() ? kb::EngineConfig{} : kb::load_engine_config(config_path);

    cfg.index.rebuild_threshold      = get_size_arg(argc, argv, "--rebuild_every", cfg.index.rebuild_threshold);
    cfg.clustering.assign_threshold  = get_double_arg(argc, argv, "--assign_threshold", cfg.clustering.assign_threshold);
    cfg.clustering.name_boost        = get_double_arg(argc, argv, "--name_boost", cfg.clustering.name_boost);
    cfg.clustering.max_concepts      = get_size_arg(argc, argv, "--max_concepts", cfg.clustering.max_concepts);
    cfg.clustering.area_threshold    = get_double_arg(argc, argv, "--area_threshold", cfg.clustering.area_threshold);
    cfg.duplicates.threshold         = get_double_arg(argc, argv, "--threshold", cfg.duplicates.threshold);
    cfg.duplicates.limit             = get_size_arg(argc, argv, "--limit", cfg.duplicates.limit);
    cfg.snippet_chars                = get_size_arg(argc, argv, "--snippet", cfg.snippet_chars);
    return cfg;
}

static kb::IngestRequest to_request(const ManifestDocument& d, concepts::ConceptExtractor& extractor) {
    kb::IngestRequest r;
    r.id = d.id;
    r.text = d.text;
    r.suggested_name = d.suggested_name;
    r.skill_level = d.skill_level;

    if (d.concepts) {
        r.concepts = *d.concepts;
        return r;
    }

    concepts::ExtractedConcepts ex = extractor.extract(d.key, d.text);
    r.concepts = ex.names();
    if (!r.suggested_name) r.suggested_name = ex.suggested_cluster;
    if (!r.skill_level) r.skill_level = ex.skill_level;
    return r;
}

std::unique_ptr<kb::KnowledgeBase> load_knowledge_base(int argc, char** argv, bool verbose) {
    const std::string manifest = get_arg(argc, argv, "--manifest", "");
    if (manifest.empty()) {
        throw std::runtime_error("missing --manifest");
    }

    const std::string concepts_dir = get_arg(argc, argv, "--concepts", "");
    std::unique_ptr<concepts::ConceptExtractor> extractor;
    if (concepts_dir.empty()) extractor = std::make_unique<concepts::NullConceptExtractor>();
    else extractor = std::make_unique<concepts::MockConceptExtractor>(concepts_dir);

    auto kbase = std::make_unique<kb::KnowledgeBase>(config_from_args(argc, argv));

    const auto docs = loadManifest(manifest);

    std::vector<kb::IngestRequest> reqs;
    reqs.reserve(docs.size());
    for (const auto& d : docs) reqs.push_back(to_request(d, *extractor));

    if (has_flag(argc, argv, "--incremental")) {
        for (const auto& r : reqs) {
            kb::ClusterId cid = kbase->ingest(r);
            if (verbose) std::cout << "ingested " << r.id << " -> cluster " << cid << "\n";
        }
    } else if (!reqs.empty()) {
        auto cids = kbase->ingest_batch(reqs);
        if (verbose) {
            for (size_t i = 0; i < reqs.size(); ++i) {
                std::cout << "ingested " << reqs[i].id << " -> cluster " << cids[i] << "\n";
            }
        }
    }

    return kbase;
}
