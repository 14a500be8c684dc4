#include "util/Similarity.hpp"
#include <algorithm>
#include <cmath>

namespace simutil {

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;

    // both sets are sorted, walk them once
    size_t inter = 0;
    auto i = a.begin();
    auto j = b.begin();
    while (i != a.end() && j != b.end()) {
        if (*i == *j) {
            ++inter; ++i; ++j;
        } else if (*i < *j) {
            ++i;
        } else {
            ++j;
        }
    }

    const size_t uni = a.size() + b.size() - inter;
    return (double)inter / (double)uni;
}

double dot_sparse(const SparseRow& a, const SparseRow& b) {
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            s += a[i].second * b[j].second;
            ++i; ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

double l2_norm(const SparseRow& v) {
    double n2 = 0.0;
    for (const auto& kv : v) n2 += kv.second * kv.second;
    return std::sqrt(n2);
}

double cosine_sparse(const SparseRow& a, double norm_a, const SparseRow& b, double norm_b) {
    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
    double c = dot_sparse(a, b) / (norm_a * norm_b);
    // rounding can push parallel vectors a hair past 1
    if (c > 1.0) c = 1.0;
    if (c < 0.0) c = 0.0;
    return c;
}

void sort_and_merge(SparseRow& v) {
    std::sort(v.begin(), v.end(), [](const auto& x, const auto& y){ return x.first < y.first; });
    size_t w = 0;
    for (size_t i = 0; i < v.size(); ) {
        uint32_t id = v[i].first;
        double sum = 0.0;
        size_t j = i;
        while (j < v.size() && v[j].first == id) {
            sum += v[j].second;
            ++j;
        }
        v[w++] = {id, sum};
        i = j;
    }
    v.resize(w);
}

}
