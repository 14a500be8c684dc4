#pragma once
#include <optional>
#include <string>
#include <vector>

namespace concepts {

struct ConceptHit {
    std::string name;
    double confidence = 0.0; // 0..1
};

struct ExtractedConcepts {
    std::vector<ConceptHit> concepts;        // most relevant first
    std::optional<std::string> suggested_cluster;
    std::optional<std::string> skill_level;  // "beginner" | "intermediate" | "advanced" | ...

    std::vector<std::string> names() const;
};

// Turns raw document text into an ordered concept list. The engine trusts the
// order: clusters keep the first entries as their representative concepts.
class ConceptExtractor {
public:
    virtual ~ConceptExtractor() = default;

    virtual ExtractedConcepts extract(const std::string& doc_key,
                                      const std::string& text) = 0;
};

class NullConceptExtractor final : public ConceptExtractor {
public:
    ExtractedConcepts extract(const std::string&, const std::string&) override { return {}; }
};

} // namespace concepts
