#include "io/JsonIO.hpp"
#include "io/JsonChecks.hpp"

#include <stdexcept>
#include <unordered_set>

using jsoncheck::json;

static ManifestDocument parseDocument(const json& j, const std::string& where) {
    jsoncheck::expect_object(j, where);

    ManifestDocument d;
    d.id   = jsoncheck::uint_field(j, "id", where);
    d.text = jsoncheck::string_field(j, "text", where);
    d.key  = jsoncheck::opt_string(j, "key", where).value_or(std::to_string(d.id));

    // null is treated like absent: ask the extractor
    if (j.contains("concepts") && !j.at("concepts").is_null()) {
        d.concepts = jsoncheck::string_list_field(j, "concepts", where);
    }
    d.suggested_name = jsoncheck::opt_string(j, "suggested_name", where);
    d.skill_level    = jsoncheck::opt_string(j, "skill_level", where);
    return d;
}

std::vector<ManifestDocument> parseManifest(const std::string& json_text) {
    const json j = jsoncheck::parse(json_text, "manifest");
    jsoncheck::expect_object(j, "root");

    const json& docs = jsoncheck::field(j, "documents", "root");
    jsoncheck::expect_array(docs, "root.documents");

    std::vector<ManifestDocument> out;
    out.reserve(docs.size());
    std::unordered_set<kb::DocId> seen;

    for (size_t i = 0; i < docs.size(); ++i) {
        const std::string where = jsoncheck::at_index("root.documents", i);
        ManifestDocument d = parseDocument(docs[i], where);
        if (!seen.insert(d.id).second) {
            throw std::runtime_error(where + ".id duplicates an earlier document: " + std::to_string(d.id));
        }
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<ManifestDocument> loadManifest(const std::string& path) {
    return parseManifest(jsoncheck::read_file(path, "manifest"));
}
