#pragma once

#include "ranking/ranking_matrix.hpp"
#include "significance/pairwise_tests.hpp"
#include "weighting/weights.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

// ---------------------------------------------------------------------------
// RankShare — weighted count of respondents meeting a rank condition, over
// the respondents who ranked the item at all.
// ---------------------------------------------------------------------------
struct RankShare {
    double count = 0.0;
    double base = 0.0;
    double effective_n = 0.0;
    size_t unweighted_base = 0;

    std::optional<double> percentage() const {
        if (base <= 0.0) return std::nullopt;
        return count / base * 100.0;
    }
};

namespace ranking {

// Respondents in `rows` with rank <= max_rank for `item`.
inline RankShare share_at_most(const RankingMatrix& m, size_t item, double max_rank,
                               const WeightSequence& weights, std::span<const size_t> rows) {
    RankShare s;
    std::vector<double> ranked_w;
    for (size_t r : rows) {
        const auto& v = m.at(r, item);
        if (!v.has_value()) continue;
        double w = weights.values[r];
        s.base += w;
        ++s.unweighted_base;
        ranked_w.push_back(w);
        if (*v <= max_rank) s.count += w;
    }
    s.effective_n = weights.weighted ? weighting::effective_n(ranked_w)
                                     : static_cast<double>(s.unweighted_base);
    return s;
}

inline RankShare pct_first(const RankingMatrix& m, size_t item, const WeightSequence& weights,
                           std::span<const size_t> rows) {
    return share_at_most(m, item, 1.0, weights, rows);
}

inline RankShare pct_top_n(const RankingMatrix& m, size_t item, int top_n,
                           const WeightSequence& weights, std::span<const size_t> rows) {
    return share_at_most(m, item, static_cast<double>(top_n), weights, rows);
}

// Ranks and weights of the respondents in `rows` who ranked `item`.
inline MeanSample rank_sample(const RankingMatrix& m, size_t item, const WeightSequence& weights,
                              std::span<const size_t> rows) {
    MeanSample s;
    for (size_t r : rows) {
        const auto& v = m.at(r, item);
        if (!v.has_value()) continue;
        s.values.push_back(*v);
        s.weights.push_back(weights.values[r]);
    }
    return s;
}

// Weighted mean rank (lower = better).
inline std::optional<double> mean_rank(const RankingMatrix& m, size_t item,
                                       const WeightSequence& weights,
                                       std::span<const size_t> rows) {
    MeanSample s = rank_sample(m, item, weights, rows);
    return weighting::weighted_mean(s.values, s.weights);
}

// Population-form variance of the ranks; undefined below two ranks.
inline std::optional<double> rank_variance(const RankingMatrix& m, size_t item,
                                           const WeightSequence& weights,
                                           std::span<const size_t> rows) {
    MeanSample s = rank_sample(m, item, weights, rows);
    if (s.values.size() < 2) return std::nullopt;
    return weighting::weighted_variance(s.values, s.weights);
}

}  // namespace ranking
