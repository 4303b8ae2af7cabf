#pragma once

#include "diagnostics.hpp"
#include "ranking/ranking_matrix.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// RankingQuality — data-quality profile of a ranking matrix
// ---------------------------------------------------------------------------
struct RankingQuality {
    size_t out_of_range = 0;
    double pct_out_of_range = 0.0;
    size_t non_integer = 0;
    size_t missing = 0;
    double pct_complete = 0.0;
    size_t respondents_with_ties = 0;
    double pct_ties = 0.0;
    size_t respondents_with_gaps = 0;
    double pct_gaps = 0.0;
    bool has_issues = false;
    std::vector<std::string> issues;

    std::string summary() const {
        char buf[160];
        if (!has_issues) {
            std::snprintf(buf, sizeof(buf), "Data quality: %.1f%% complete, %.1f%% ties, %.1f%% gaps",
                          pct_complete, pct_ties, pct_gaps);
            return buf;
        }
        std::string s = "Data quality issues detected: ";
        for (size_t i = 0; i < issues.size(); ++i) {
            if (i > 0) s += "; ";
            s += issues[i];
        }
        return s;
    }
};

struct RankingThresholds {
    double tie_pct = 5.0;
    double gap_pct = 5.0;
    double completeness_pct = 80.0;
};

namespace ranking {

inline RankingQuality validate(const RankingMatrix& m, const RankingThresholds& thresholds) {
    if (m.empty()) {
        throw CrosstabError(ErrorCode::DATA_EMPTY_RANKING, "Empty Ranking Matrix",
                            "The ranking matrix has no respondents or no items",
                            "No ranking metrics can be computed.",
                            "Check the ranking columns and the question's options.");
    }

    RankingQuality q;
    size_t valid = 0;
    double positions = static_cast<double>(m.num_positions());
    std::vector<double> ranks;

    for (size_t r = 0; r < m.rows(); ++r) {
        ranks.clear();
        for (size_t i = 0; i < m.item_count(); ++i) {
            const auto& v = m.at(r, i);
            if (!v.has_value()) {
                ++q.missing;
                continue;
            }
            ++valid;
            if (*v < 1.0 || *v > positions) ++q.out_of_range;
            if (*v != std::floor(*v)) ++q.non_integer;
            ranks.push_back(*v);
        }
        std::sort(ranks.begin(), ranks.end());
        if (std::adjacent_find(ranks.begin(), ranks.end()) != ranks.end()) {
            ++q.respondents_with_ties;
        }
        if (ranks.size() > 1) {
            for (size_t k = 0; k < ranks.size(); ++k) {
                if (ranks[k] != static_cast<double>(k + 1)) {
                    ++q.respondents_with_gaps;
                    break;
                }
            }
        }
    }

    double cells = static_cast<double>(m.rows() * m.item_count());
    double n = static_cast<double>(m.rows());
    q.pct_out_of_range = valid > 0 ? 100.0 * static_cast<double>(q.out_of_range) / valid : 0.0;
    q.pct_complete = 100.0 * (1.0 - static_cast<double>(q.missing) / cells);
    q.pct_ties = 100.0 * static_cast<double>(q.respondents_with_ties) / n;
    q.pct_gaps = 100.0 * static_cast<double>(q.respondents_with_gaps) / n;

    char buf[160];
    if (q.out_of_range > 0) {
        std::snprintf(buf, sizeof(buf), "%zu values (%.1f%%) out of valid range [1, %d]",
                      q.out_of_range, q.pct_out_of_range, m.num_positions());
        q.issues.push_back(buf);
    }
    if (q.non_integer > 0) {
        q.issues.push_back(std::to_string(q.non_integer) + " non-integer rank values");
    }
    if (q.pct_ties > thresholds.tie_pct) {
        std::snprintf(buf, sizeof(buf), "%.1f%% of respondents have tied ranks (threshold: %.0f%%)",
                      q.pct_ties, thresholds.tie_pct);
        q.issues.push_back(buf);
    }
    if (q.pct_gaps > thresholds.gap_pct) {
        std::snprintf(buf, sizeof(buf),
                      "%.1f%% of respondents have gaps in rankings (threshold: %.0f%%)",
                      q.pct_gaps, thresholds.gap_pct);
        q.issues.push_back(buf);
    }
    if (q.pct_complete < thresholds.completeness_pct) {
        std::snprintf(buf, sizeof(buf), "Only %.1f%% complete (threshold: %.0f%%)",
                      q.pct_complete, thresholds.completeness_pct);
        q.issues.push_back(buf);
    }
    q.has_issues = !q.issues.empty();
    return q;
}

}  // namespace ranking
