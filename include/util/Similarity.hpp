#pragma once
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace simutil {

// sparse row: (term_id, weight), sorted by term_id, unique ids
using SparseRow = std::vector<std::pair<uint32_t, double>>;

// |A ∩ B| / |A ∪ B|; both empty -> 0.0
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

double dot_sparse(const SparseRow& a, const SparseRow& b);

double l2_norm(const SparseRow& v);

// cosine in [0,1] for non-negative rows; 0.0 if either side is a zero vector
double cosine_sparse(const SparseRow& a, double norm_a, const SparseRow& b, double norm_b);

// sort by term id and sum duplicate ids
void sort_and_merge(SparseRow& v);

// Ranked output order shared by search and duplicate detection:
// higher score first, lower id on ties.
template <typename Id>
bool ranks_before(double score_a, Id id_a, double score_b, Id id_b) {
    if (score_a != score_b) return score_a > score_b;
    return id_a < id_b;
}

}
