#include "concepts/MockConceptExtractor.hpp"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace concepts {

std::vector<std::string> ExtractedConcepts::names() const {
    std::vector<std::string> out;
    out.reserve(concepts.size());
    for (const auto& c : concepts) out.push_back(c.name);
    return out;
}

MockConceptExtractor::MockConceptExtractor(const std::string& root_dir) : root_(root_dir) {}

ExtractedConcepts MockConceptExtractor::parse(const std::string& json_text) {
    ExtractedConcepts out;

    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error&) {
        return out;
    }

    if (!j.is_object()) return out;

    if (j.contains("concepts") && j["concepts"].is_array()) {
        for (const auto& c : j["concepts"]) {
            ConceptHit hit;
            if (c.is_string()) {
                hit.name = c.get<std::string>();
                hit.confidence = 1.0;
            } else if (c.is_object()) {
                if (c.contains("name") && c["name"].is_string()) hit.name = c["name"].get<std::string>();
                if (c.contains("confidence") && c["confidence"].is_number())
                    hit.confidence = c["confidence"].get<double>();
            }
            if (!hit.name.empty()) out.concepts.push_back(std::move(hit));
        }
    }

    if (j.contains("suggested_cluster") && j["suggested_cluster"].is_string())
        out.suggested_cluster = j["suggested_cluster"].get<std::string>();
    if (j.contains("skill_level") && j["skill_level"].is_string())
        out.skill_level = j["skill_level"].get<std::string>();

    // most confident first; equal confidence keeps file order
    std::stable_sort(out.concepts.begin(), out.concepts.end(), [](const ConceptHit& a, const ConceptHit& b){
        return a.confidence > b.confidence;
    });

    return out;
}

ExtractedConcepts MockConceptExtractor::load_file_for_key(const std::string& doc_key) const {
    fs::path p = root_ / (doc_key + ".json");
    std::ifstream f(p);
    if (!f) return {};

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse(ss.str());
}

ExtractedConcepts MockConceptExtractor::extract(const std::string& doc_key,
                                                const std::string&) {
    return load_file_for_key(doc_key);
}

} // namespace concepts
