#pragma once
#include "kb/Ids.hpp"

#include <optional>
#include <string>
#include <vector>

// One document of an ingest manifest. "concepts" absent means "ask the
// concept extractor"; present-but-empty means "this document has none".
struct ManifestDocument {
    kb::DocId id = 0;
    std::string key;   // extractor lookup key, defaults to the id
    std::string text;
    std::optional<std::vector<std::string>> concepts;
    std::optional<std::string> suggested_name;
    std::optional<std::string> skill_level;
};

// {"documents":[{"id":0,"text":"...","key"?:"...","concepts"?:[...],
//                "suggested_name"?:"...","skill_level"?:"..."}]}
std::vector<ManifestDocument> loadManifest(const std::string& path);
std::vector<ManifestDocument> parseManifest(const std::string& json_text);
