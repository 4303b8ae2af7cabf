#pragma once

#include "significance/statistical_tests.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ChiSquareResult — independence test over a category x segment table
// ---------------------------------------------------------------------------
struct ChiSquareResult {
    bool ran = false;
    std::string skip_reason;
    double statistic = 0.0;
    int df = 0;
    double p_value = 1.0;
    bool significant = false;
    size_t categories_used = 0;
    std::vector<std::string> excluded_categories;
    std::vector<std::string> excluded_segments;
    double min_expected = 0.0;
    double low_expected_pct = 0.0;    // % of cells with expected count < 5

    bool small_sample() const { return min_expected < 1.0 || low_expected_pct > 20.0; }

    std::string message() const {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "Chi-square (%zu categories): χ²=%.2f, df=%d, p=%.4f%s",
                      categories_used, statistic, df, p_value, significant ? " **" : "");
        std::string msg = buf;
        if (!excluded_categories.empty() || !excluded_segments.empty()) {
            std::vector<std::string> all = excluded_categories;
            all.insert(all.end(), excluded_segments.begin(), excluded_segments.end());
            msg += " [Excluded: ";
            for (size_t i = 0; i < all.size(); ++i) {
                if (i > 0) msg += ", ";
                msg += all[i];
            }
            msg += "]";
        }
        if (small_sample()) msg += " [Note: Small sample in some cells]";
        return msg;
    }
};

namespace chi_square {

constexpr double MIN_CELL_COUNT = 5.0;
constexpr double MIN_SHARE_OF_TOTAL = 0.01;
constexpr double MIN_EXPECTED = 0.5;
constexpr double MAX_LOW_EXPECTED_PCT = 40.0;

// observed[r][c]: weighted count of category r in segment c.
// Categories and segments whose total is below max(5, 1% of the grand total)
// are dropped first; the test is skipped (not failed) when fewer than two of
// either remain or the expected-count rules are not met.
inline ChiSquareResult test_independence(const std::vector<std::vector<double>>& observed,
                                         const std::vector<std::string>& category_labels,
                                         const std::vector<std::string>& segment_labels,
                                         double alpha) {
    ChiSquareResult res;
    size_t n_rows = observed.size();
    size_t n_cols = n_rows > 0 ? observed[0].size() : 0;
    if (n_rows < 2 || n_cols < 2) {
        res.skip_reason = "fewer than two categories or segments";
        return res;
    }

    double grand = 0.0;
    std::vector<double> row_tot(n_rows, 0.0), col_tot(n_cols, 0.0);
    for (size_t r = 0; r < n_rows; ++r) {
        for (size_t c = 0; c < n_cols; ++c) {
            row_tot[r] += observed[r][c];
            col_tot[c] += observed[r][c];
            grand += observed[r][c];
        }
    }
    double min_count = std::max(MIN_CELL_COUNT, MIN_SHARE_OF_TOTAL * grand);

    std::vector<size_t> keep_rows, keep_cols;
    for (size_t r = 0; r < n_rows; ++r) {
        if (row_tot[r] >= min_count) keep_rows.push_back(r);
        else res.excluded_categories.push_back(category_labels[r]);
    }
    for (size_t c = 0; c < n_cols; ++c) {
        if (col_tot[c] >= min_count) keep_cols.push_back(c);
        else res.excluded_segments.push_back(segment_labels[c]);
    }
    if (keep_rows.size() < 2 || keep_cols.size() < 2) {
        res.skip_reason = "fewer than two categories or segments above the minimum count";
        return res;
    }

    std::vector<double> rt(keep_rows.size(), 0.0), ct(keep_cols.size(), 0.0);
    double total = 0.0;
    for (size_t i = 0; i < keep_rows.size(); ++i) {
        for (size_t j = 0; j < keep_cols.size(); ++j) {
            double o = observed[keep_rows[i]][keep_cols[j]];
            rt[i] += o;
            ct[j] += o;
            total += o;
        }
    }
    if (total <= 0.0) {
        res.skip_reason = "empty table";
        return res;
    }

    double chi2 = 0.0;
    size_t low_cells = 0;
    res.min_expected = rt[0] * ct[0] / total;
    for (size_t i = 0; i < keep_rows.size(); ++i) {
        for (size_t j = 0; j < keep_cols.size(); ++j) {
            double e = rt[i] * ct[j] / total;
            res.min_expected = std::min(res.min_expected, e);
            if (e < 5.0) ++low_cells;
            double o = observed[keep_rows[i]][keep_cols[j]];
            if (e > 0.0) chi2 += (o - e) * (o - e) / e;
        }
    }
    res.low_expected_pct = 100.0 * static_cast<double>(low_cells) /
                           static_cast<double>(keep_rows.size() * keep_cols.size());

    if (res.min_expected < MIN_EXPECTED) {
        res.skip_reason = "minimum expected count below 0.5";
        return res;
    }
    if (res.low_expected_pct > MAX_LOW_EXPECTED_PCT) {
        res.skip_reason = "more than 40% of expected counts below 5";
        return res;
    }

    res.ran = true;
    res.categories_used = keep_rows.size();
    res.statistic = chi2;
    res.df = static_cast<int>((keep_rows.size() - 1) * (keep_cols.size() - 1));
    res.p_value = detail::chi2_sf(chi2, res.df);
    res.significant = res.p_value < alpha;
    return res;
}

}  // namespace chi_square
