#pragma once

#include "cells/cell_calculator.hpp"
#include "cells/question_table.hpp"
#include "processing/question_context.hpp"
#include "significance/sig_letters.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// NumericStats — descriptive statistics of one segment's numeric answers
// ---------------------------------------------------------------------------
struct NumericStats {
    std::optional<double> mean;
    std::optional<double> median;
    std::optional<double> mode;
    std::optional<double> sd;
    size_t outlier_count = 0;
    size_t n_valid = 0;
    MeanSample sample;             // values used for mean / sd (outliers removed if asked)
};

namespace processing {

namespace detail {

// Linear-interpolation quantile of sorted values (the common "type 7" rule).
inline double quantile_sorted(const std::vector<double>& sorted, double p) {
    double h = (static_cast<double>(sorted.size()) - 1.0) * p;
    size_t lo = static_cast<size_t>(std::floor(h));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

}  // namespace detail

// Flags values outside [Q1 - 1.5 IQR, Q3 + 1.5 IQR]; needs at least 4 values.
inline std::vector<bool> iqr_outliers(const std::vector<double>& values) {
    std::vector<bool> flags(values.size(), false);
    if (values.size() < 4) return flags;
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    double q1 = detail::quantile_sorted(sorted, 0.25);
    double q3 = detail::quantile_sorted(sorted, 0.75);
    double iqr = q3 - q1;
    for (size_t i = 0; i < values.size(); ++i) {
        flags[i] = values[i] < q1 - 1.5 * iqr || values[i] > q3 + 1.5 * iqr;
    }
    return flags;
}

inline double median_of(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    return detail::quantile_sorted(values, 0.5);
}

// Single most frequent value; nullopt when tied or when nothing repeats.
inline std::optional<double> mode_of(const std::vector<double>& values) {
    std::map<double, size_t> freq;
    for (double v : values) ++freq[v];
    size_t best = 0, holders = 0;
    double value = 0.0;
    for (const auto& [v, n] : freq) {
        if (n > best) {
            best = n;
            holders = 1;
            value = v;
        } else if (n == best) {
            ++holders;
        }
    }
    if (holders != 1 || best < 2) return std::nullopt;
    return value;
}

inline NumericStats numeric_stats(const QuestionContext& ctx, const Column& col,
                                  std::span<const size_t> rows) {
    const QuestionDef& q = ctx.question;
    const CrosstabConfig& cfg = ctx.cfg;
    NumericStats st;

    std::vector<double> values, weights;
    for (size_t r : rows) {
        auto v = col.number_at(r);
        if (!v.has_value()) continue;
        if (q.min_value.has_value() && *v < *q.min_value) continue;
        if (q.max_value.has_value() && *v > *q.max_value) continue;
        values.push_back(*v);
        weights.push_back(ctx.weights.values[r]);
    }
    st.n_valid = values.size();
    if (values.empty()) return st;

    std::vector<bool> outliers(values.size(), false);
    if (cfg.show_numeric_outliers || cfg.exclude_outliers_from_stats) {
        outliers = iqr_outliers(values);
        st.outlier_count = static_cast<size_t>(std::count(outliers.begin(), outliers.end(), true));
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (cfg.exclude_outliers_from_stats && outliers[i]) continue;
        st.sample.values.push_back(values[i]);
        st.sample.weights.push_back(weights[i]);
    }
    if (st.sample.values.empty()) return st;

    st.mean = weighting::weighted_mean(st.sample.values, st.sample.weights);
    st.sd = weighting::weighted_sd(st.sample.values, st.sample.weights);
    if (!ctx.is_weighted()) {
        st.median = median_of(st.sample.values);
        st.mode = mode_of(st.sample.values);
    }
    return st;
}

// Bin label of a value: first option (by Min) whose [Min, Max] contains it.
inline std::optional<size_t> bin_of(double v, const std::vector<OptionDef>& bins_by_min) {
    for (size_t b = 0; b < bins_by_min.size(); ++b) {
        const auto& o = bins_by_min[b];
        if (!o.min.has_value() || !o.max.has_value()) continue;
        if (v >= *o.min && v <= *o.max) return b;
    }
    return std::nullopt;
}

inline std::vector<QuestionRow> process_numeric(const QuestionContext& ctx) {
    const CrosstabConfig& cfg = ctx.cfg;
    const Column& col = ctx.table.column(ctx.code());
    std::vector<QuestionRow> rows;

    // Bins
    std::vector<OptionDef> bins = ctx.survey.options(ctx.code());
    if (!bins.empty()) {
        std::vector<OptionDef> by_min = bins;
        std::stable_sort(by_min.begin(), by_min.end(), [](const OptionDef& a, const OptionDef& b) {
            double no_min = std::numeric_limits<double>::infinity();
            return a.min.value_or(no_min) < b.min.value_or(no_min);
        });
        SurveyStructure::sort_by_display_order(bins);

        std::vector<std::vector<double>> counts(by_min.size(),
                                                std::vector<double>(ctx.index_map.size(), 0.0));
        for (size_t c = 0; c < ctx.index_map.size(); ++c) {
            for (size_t r : ctx.index_map.rows(c)) {
                auto v = col.number_at(r);
                if (!v.has_value()) continue;
                if (auto b = bin_of(*v, by_min)) counts[*b][c] += ctx.weights.values[r];
            }
        }
        for (const auto& bin : bins) {
            size_t b = 0;
            while (b < by_min.size() && by_min[b].option_text != bin.option_text) ++b;
            if (cfg.show_frequency) rows.push_back(cells::frequency_row(bin.label(), counts[b]));
            if (cfg.show_percent_column) {
                rows.push_back(cells::column_pct_row(bin.label(), counts[b], ctx.bases,
                                                     ctx.is_weighted()));
            }
        }
    }

    // Statistics
    std::vector<NumericStats> stats;
    for (size_t c = 0; c < ctx.index_map.size(); ++c) {
        stats.push_back(numeric_stats(ctx, col, ctx.index_map.rows(c)));
    }

    auto stat_row = [&](const std::string& label, RowKind kind, auto get) {
        QuestionRow row;
        row.label = label;
        row.kind = kind;
        for (const auto& s : stats) row.cells.push_back(get(s));
        return row;
    };

    rows.push_back(stat_row("Mean", RowKind::AVERAGE,
                            [](const NumericStats& s) { return cells::to_cell(s.mean); }));
    if (cfg.show_numeric_median) {
        rows.push_back(stat_row("Median", RowKind::MEDIAN, [&](const NumericStats& s) {
            if (ctx.is_weighted()) return Cell{std::string("N/A (weighted)")};
            return cells::to_cell(s.median);
        }));
    }
    if (cfg.show_numeric_mode) {
        rows.push_back(stat_row("Mode", RowKind::MODE, [&](const NumericStats& s) {
            if (ctx.is_weighted()) return Cell{std::string("N/A (weighted)")};
            if (!s.mode.has_value()) return Cell{std::string("No single mode")};
            return Cell{*s.mode};
        }));
    }
    rows.push_back(stat_row("Standard Deviation", RowKind::STD_DEV,
                            [](const NumericStats& s) { return cells::to_cell(s.sd); }));
    if (cfg.show_numeric_outliers) {
        std::string label = cfg.exclude_outliers_from_stats ? "Outliers (excluded)"
                                                            : "Outliers (IQR)";
        rows.push_back(stat_row(label, RowKind::OUTLIERS, [](const NumericStats& s) {
            return Cell{static_cast<double>(s.outlier_count)};
        }));
    }

    if (ctx.testing()) {
        std::vector<std::optional<MeanSample>> samples;
        for (const auto& s : stats) {
            if (s.mean.has_value()) samples.emplace_back(s.sample);
            else samples.emplace_back(std::nullopt);
        }
        rows.push_back(significance::mean_letters(ctx.structure, samples, ctx.sig_settings(),
                                                  ctx.code(), "Mean", ctx.diag));
    }
    return rows;
}

}  // namespace processing
