#pragma once

#include "concepts/ConceptExtractor.hpp"

#include <filesystem>
#include <string>

namespace concepts {

// Serves canned extraction results from <root>/<doc_key>.json:
//   {"concepts":[{"name":"...","confidence":0.9}],
//    "suggested_cluster":"...", "skill_level":"..."}
// A missing or malformed file yields an empty result.
class MockConceptExtractor final : public ConceptExtractor {
    std::filesystem::path root_;

public:
    explicit MockConceptExtractor(const std::string& root_dir);

    // ignores text, uses doc_key to fetch the canned response
    ExtractedConcepts extract(const std::string& doc_key,
                              const std::string& text) override;

    static ExtractedConcepts parse(const std::string& json_text);

private:
    ExtractedConcepts load_file_for_key(const std::string& doc_key) const;
};

} // namespace concepts
