#pragma once

#include "config/crosstab_config.hpp"
#include "data/respondent_table.hpp"
#include "diagnostics.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// WeightSummary — descriptive statistics of a repaired weight vector
// Moments are taken over strictly positive weights.
// ---------------------------------------------------------------------------
struct WeightSummary {
    size_t n_total = 0;
    size_t n_positive = 0;
    size_t n_zero = 0;
    size_t n_missing = 0;
    size_t n_negative = 0;
    size_t n_infinite = 0;
    double sum = 0.0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double sd = 0.0;
    double cv = 0.0;
    double effective_n = 0.0;
    double design_effect = 0.0;
};

// ---------------------------------------------------------------------------
// WeightSequence — one non-negative weight per respondent row
// ---------------------------------------------------------------------------
struct WeightSequence {
    std::vector<double> values;
    bool weighted = false;     // false => unit weights, weighting off downstream
    WeightSummary summary;

    size_t size() const { return values.size(); }
    std::span<const double> view() const { return {values.data(), values.size()}; }
};

namespace weighting {

constexpr double ZERO_WEIGHT_WARN_FRACTION = 0.05;
constexpr double HIGH_CV_THRESHOLD = 1.0;

// Kish effective sample size over strictly positive weights; 0 if none.
inline double effective_n(std::span<const double> weights) {
    double sum = 0.0, sum_sq = 0.0;
    for (double w : weights) {
        if (!(w > 0.0) || std::isinf(w)) continue;
        sum += w;
        sum_sq += w * w;
    }
    if (sum_sq <= 0.0) return 0.0;
    return (sum * sum) / sum_sq;
}

// Effective n of the weights at the given rows, without copying them.
inline double effective_n(std::span<const double> weights, std::span<const size_t> rows) {
    double sum = 0.0, sum_sq = 0.0;
    for (size_t r : rows) {
        double w = weights[r];
        if (!(w > 0.0) || std::isinf(w)) continue;
        sum += w;
        sum_sq += w * w;
    }
    if (sum_sq <= 0.0) return 0.0;
    return (sum * sum) / sum_sq;
}

// n_nonzero / eff_n; 0 when there are no positive weights.
inline double design_effect(std::span<const double> weights) {
    size_t n_nonzero = 0;
    for (double w : weights) {
        if (w > 0.0 && !std::isinf(w)) ++n_nonzero;
    }
    double eff = effective_n(weights);
    if (eff <= 0.0) return 0.0;
    return static_cast<double>(n_nonzero) / eff;
}

// sd/mean of positive weights (sample sd); 0 with fewer than two.
inline double weight_cv(std::span<const double> weights) {
    double sum = 0.0;
    size_t n = 0;
    for (double w : weights) {
        if (w > 0.0 && !std::isinf(w)) {
            sum += w;
            ++n;
        }
    }
    if (n < 2) return 0.0;
    double mean = sum / static_cast<double>(n);
    double ss = 0.0;
    for (double w : weights) {
        if (w > 0.0 && !std::isinf(w)) ss += (w - mean) * (w - mean);
    }
    double sd = std::sqrt(ss / static_cast<double>(n - 1));
    return mean > 0.0 ? sd / mean : 0.0;
}

// Weighted mean over pairs with a finite value and w > 0.
inline std::optional<double> weighted_mean(std::span<const double> values,
                                           std::span<const double> weights) {
    double sw = 0.0, swx = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i]) || !(weights[i] > 0.0)) continue;
        sw += weights[i];
        swx += weights[i] * values[i];
    }
    if (sw <= 0.0) return std::nullopt;
    return swx / sw;
}

// Population-form weighted variance sum(w(x-m)^2)/sum(w).
inline std::optional<double> weighted_variance(std::span<const double> values,
                                               std::span<const double> weights) {
    auto m = weighted_mean(values, weights);
    if (!m.has_value()) return std::nullopt;
    double sw = 0.0, ss = 0.0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i]) || !(weights[i] > 0.0)) continue;
        sw += weights[i];
        ss += weights[i] * (values[i] - *m) * (values[i] - *m);
    }
    return ss / sw;
}

// Standard deviation for summary rows: sample sd when every weight is 1,
// weighted population sd otherwise. Needs at least two valid values.
inline std::optional<double> weighted_sd(std::span<const double> values,
                                         std::span<const double> weights) {
    size_t n = 0;
    bool all_unit = true;
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i]) || !(weights[i] > 0.0)) continue;
        ++n;
        if (weights[i] != 1.0) all_unit = false;
    }
    if (n < 2) return std::nullopt;
    auto var = weighted_variance(values, weights);
    if (!var.has_value()) return std::nullopt;
    if (all_unit) {
        return std::sqrt(*var * static_cast<double>(n) / static_cast<double>(n - 1));
    }
    return std::sqrt(*var);
}

inline WeightSummary summarize(std::span<const double> weights) {
    WeightSummary s{};
    s.n_total = weights.size();
    s.min = std::numeric_limits<double>::infinity();
    s.max = -std::numeric_limits<double>::infinity();
    for (double w : weights) {
        if (std::isnan(w)) { ++s.n_missing; continue; }
        if (std::isinf(w)) { ++s.n_infinite; continue; }
        if (w < 0.0) { ++s.n_negative; continue; }
        if (w == 0.0) { ++s.n_zero; continue; }
        ++s.n_positive;
        s.sum += w;
        s.min = std::min(s.min, w);
        s.max = std::max(s.max, w);
    }
    if (s.n_positive == 0) {
        s.min = 0.0;
        s.max = 0.0;
        return s;
    }
    s.mean = s.sum / static_cast<double>(s.n_positive);
    s.cv = weight_cv(weights);
    s.sd = s.cv * s.mean;
    s.effective_n = effective_n(weights);
    s.design_effect = design_effect(weights);
    return s;
}

namespace detail {

inline std::string pct_str(size_t part, size_t whole) {
    char buf[32];
    double pct = whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 0.0;
    std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
    return buf;
}

inline CrosstabError no_valid_weights(const std::string& var) {
    return CrosstabError(ErrorCode::DATA_NO_VALID_WEIGHTS, "No Valid Weights",
                         "Weight column '" + var + "' has no positive finite values",
                         "Every weighted estimate would be undefined.",
                         "Check the weight column or disable weighting.");
}

}  // namespace detail

// Validate and repair a raw weight column into a WeightSequence.
// Raw values: NaN = missing. Throws CrosstabError on configuration or
// policy failures; repairs and variability findings go to `diag`.
inline WeightSequence repair_weights(std::vector<double> raw, const std::string& var,
                                     WeightRepairPolicy policy, Diagnostics& diag) {
    const std::string source = "weighting";
    WeightSummary before = summarize(raw);
    if (before.n_positive == 0) throw detail::no_valid_weights(var);

    switch (policy) {
        case WeightRepairPolicy::EXCLUDE: {
            if (before.n_negative > 0) {
                throw CrosstabError(ErrorCode::DATA_NEGATIVE_WEIGHTS, "Negative Weights",
                                    "Weight column '" + var + "' has " +
                                        std::to_string(before.n_negative) + " negative values",
                                    "Negative weights invert the contribution of respondents.",
                                    "Fix the weighting scheme; negative weights are never repaired.");
            }
            for (double& w : raw) {
                if (std::isnan(w) || std::isinf(w)) w = 0.0;
            }
            if (before.n_missing > 0) {
                diag.warn(source, std::to_string(before.n_missing) +
                                      " missing weights set to 0 (excluded)");
            }
            if (before.n_infinite > 0) {
                diag.warn(source, std::to_string(before.n_infinite) +
                                      " infinite weights set to 0 (excluded)");
            }
            size_t zeros = before.n_zero + before.n_missing + before.n_infinite;
            if (static_cast<double>(zeros) >
                ZERO_WEIGHT_WARN_FRACTION * static_cast<double>(raw.size())) {
                diag.warn(source, detail::pct_str(zeros, raw.size()) +
                                      " of respondents have zero weight and are excluded");
            }
            break;
        }
        case WeightRepairPolicy::COERCE_TO_ONE: {
            diag.warn(source, "coerce_to_one policy is a legacy mode: invalid weights become 1, "
                              "which biases weighted estimates");
            if (before.n_missing > 0) {
                diag.warn(source, std::to_string(before.n_missing) + " missing weights set to 1");
            }
            if (before.n_negative > 0) {
                diag.warn(source, std::to_string(before.n_negative) + " negative weights set to 1");
            }
            if (before.n_zero > 0) {
                diag.warn(source, std::to_string(before.n_zero) + " zero weights set to 1");
            }
            if (before.n_infinite > 0) {
                diag.warn(source, std::to_string(before.n_infinite) + " infinite weights set to 1");
            }
            for (double& w : raw) {
                if (std::isnan(w) || std::isinf(w) || w <= 0.0) w = 1.0;
            }
            break;
        }
        case WeightRepairPolicy::ERROR: {
            std::string issues;
            auto add = [&](size_t n, const char* what) {
                if (n == 0) return;
                if (!issues.empty()) issues += ", ";
                issues += std::to_string(n) + " " + what;
            };
            add(before.n_missing, "missing");
            add(before.n_zero, "zero");
            add(before.n_negative, "negative");
            add(before.n_infinite, "infinite");
            if (!issues.empty()) {
                throw CrosstabError(ErrorCode::DATA_INVALID_WEIGHTS, "Invalid Weights",
                                    "Weight column '" + var + "' has " + issues + " values",
                                    "The error policy forbids repairing weights.",
                                    "Clean the weight column or choose the exclude policy.");
            }
            break;
        }
    }

    WeightSequence seq;
    seq.values = std::move(raw);
    seq.weighted = true;
    seq.summary = summarize(seq.view());
    if (seq.summary.n_positive == 0) throw detail::no_valid_weights(var);

    if (seq.summary.cv > HIGH_CV_THRESHOLD) {
        char buf[128];
        std::snprintf(buf, sizeof(buf),
                      "high weight variability (CV = %.2f); effective n = %.1f of %zu",
                      seq.summary.cv, seq.summary.effective_n, seq.summary.n_positive);
        diag.warn(source, buf);
    }
    return seq;
}

inline WeightSequence unit_weights(size_t row_count) {
    WeightSequence seq;
    seq.values.assign(row_count, 1.0);
    seq.weighted = false;
    seq.summary = summarize(seq.view());
    return seq;
}

// Build the run's weight sequence from configuration.
inline WeightSequence build_weights(const RespondentTable& table, const CrosstabConfig& cfg,
                                    Diagnostics& diag) {
    if (!cfg.is_weighted()) return unit_weights(table.row_count());

    const Column* col = table.find_column(cfg.weight_variable);
    if (!col) {
        throw CrosstabError(ErrorCode::DATA_WEIGHT_COLUMN_NOT_FOUND, "Weight Column Not Found",
                            "Weight variable '" + cfg.weight_variable + "' is not in the data",
                            "Weighted results cannot be produced.",
                            "Check weight_variable or disable apply_weighting.");
    }

    std::vector<double> raw(table.row_count());
    for (size_t r = 0; r < table.row_count(); ++r) {
        if (col->is_missing(r)) {
            raw[r] = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        auto v = col->number_at(r);
        if (!v.has_value()) {
            throw CrosstabError(ErrorCode::DATA_INVALID_TYPE, "Non-numeric Weights",
                                "Weight column '" + cfg.weight_variable +
                                    "' contains non-numeric value '" + *col->text_at(r) + "'",
                                "Weights must be numbers.",
                                "Clean the weight column.");
        }
        raw[r] = *v;
    }
    return repair_weights(std::move(raw), cfg.weight_variable, cfg.weight_policy, diag);
}

}  // namespace weighting
