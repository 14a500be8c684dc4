#pragma once
#include <string>
#include <vector>

namespace textutil {

// lowercase, keep letters/digits/+/#, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop very short junk tokens
std::vector<std::string> tokenize(const std::string& normalized);

// normalize + tokenize
std::vector<std::string> terms_of(const std::string& raw);

// Case-fold a concept name so that spellings differing only by case,
// full-width forms or composed/decomposed accents compare equal.
// Also trims and collapses internal whitespace.
std::string fold_concept(const std::string& s);

// fold every entry, drop empties and duplicates, keep first-seen order
std::vector<std::string> fold_concepts(const std::vector<std::string>& names);

// first max_chars bytes (cut on a UTF-8 boundary) + "..." when truncated
std::string snippet(const std::string& text, size_t max_chars = 100);

}
