#pragma once

#include "weighting/weights.hpp"

#include <cstddef>
#include <span>

// ---------------------------------------------------------------------------
// BaseSize — sample size of one segment
// effective == unweighted when weighting is off.
// ---------------------------------------------------------------------------
struct BaseSize {
    double unweighted = 0.0;
    double weighted = 0.0;
    double effective = 0.0;

    // Base used for percentages: weighted when weighting is on.
    double percent_base(bool is_weighted) const { return is_weighted ? weighted : unweighted; }
    // Sample size used by significance tests.
    double test_n(bool is_weighted) const { return is_weighted ? effective : unweighted; }
};

namespace weighting {

inline BaseSize compute_base(const WeightSequence& weights, std::span<const size_t> rows) {
    BaseSize b{};
    b.unweighted = static_cast<double>(rows.size());
    if (!weights.weighted) {
        b.weighted = b.unweighted;
        b.effective = b.unweighted;
        return b;
    }
    for (size_t r : rows) b.weighted += weights.values[r];
    b.effective = effective_n(weights.view(), rows);
    return b;
}

}  // namespace weighting
