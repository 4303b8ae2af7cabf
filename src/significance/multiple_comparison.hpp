#pragma once

#include <cstddef>

// Number of unordered pairs among k segments: C(k, 2).
inline size_t pair_count(size_t k) {
    return k < 2 ? 0 : k * (k - 1) / 2;
}

// Bonferroni-adjusted alpha for all pairwise comparisons among k segments.
// Returns the nominal alpha when disabled or when there is nothing to compare.
inline double bonferroni_alpha(double alpha, size_t k, bool enabled) {
    size_t m = pair_count(k);
    if (!enabled || m == 0) return alpha;
    return alpha / static_cast<double>(m);
}
