#pragma once

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "cells/question_table.hpp"
#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "text_utils.hpp"
#include "weighting/bases.hpp"
#include "weighting/weights.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SummaryStatistic — per-segment mean / index / NPS with the samples behind
// it (kept for t-tests and standard deviations).
// ---------------------------------------------------------------------------
struct SummaryStatistic {
    std::string name;              // "Mean", "Index", "NPS Score"
    RowKind kind = RowKind::AVERAGE;
    double value = 0.0;
    std::vector<double> values;
    std::vector<double> weights;
};

namespace cells {

// (count / base) * 100; undefined when the base is zero.
inline std::optional<double> percentage(double count, double base) {
    if (base == 0.0) return std::nullopt;
    return (count / base) * 100.0;
}

inline Cell to_cell(const std::optional<double>& v) {
    if (!v.has_value()) return std::monostate{};
    return *v;
}

// Weighted count of matches per banner column.
// Every (data column, value) match adds the row's weight, so a respondent
// holding the option in two mention slots is counted twice. Segment
// membership uses OR logic instead.
inline std::vector<double> row_counts(const RowIndexMap& index_map,
                                      const WeightSequence& weights,
                                      const std::vector<const Column*>& data_cols,
                                      const std::vector<std::string>& option_values) {
    std::vector<double> counts(index_map.size(), 0.0);
    for (size_t c = 0; c < index_map.size(); ++c) {
        double total = 0.0;
        for (size_t r : index_map.rows(c)) {
            double w = weights.values[r];
            for (const Column* dc : data_cols) {
                for (const auto& v : option_values) {
                    if (dc->matches(r, v)) total += w;
                }
            }
        }
        counts[c] = total;
    }
    return counts;
}

inline QuestionRow frequency_row(const std::string& label, const std::vector<double>& counts) {
    QuestionRow row;
    row.label = label;
    row.kind = RowKind::FREQUENCY;
    for (double c : counts) row.cells.emplace_back(c);
    return row;
}

// Column %: count over the segment's own base.
inline QuestionRow column_pct_row(const std::string& label, const std::vector<double>& counts,
                                  const std::vector<BaseSize>& bases, bool is_weighted) {
    QuestionRow row;
    row.label = label;
    row.kind = RowKind::COLUMN_PCT;
    for (size_t c = 0; c < counts.size(); ++c) {
        row.cells.push_back(to_cell(percentage(counts[c], bases[c].percent_base(is_weighted))));
    }
    return row;
}

// Row %: count over the row total within the column's banner group.
// Total shows 100 unless its count is zero.
inline QuestionRow row_pct_row(const std::string& label, const std::vector<double>& counts,
                               const BannerStructure& structure, bool zero_division_as_blank) {
    QuestionRow row;
    row.label = label;
    row.kind = RowKind::ROW_PCT;
    row.cells.assign(counts.size(), std::monostate{});

    Cell zero_cell = zero_division_as_blank ? Cell{std::monostate{}} : Cell{0.0};

    row.cells[BannerStructure::TOTAL_INDEX] =
        counts[BannerStructure::TOTAL_INDEX] == 0.0 ? zero_cell : Cell{100.0};

    for (const auto& group : structure.groups()) {
        double group_total = 0.0;
        for (size_t c : group.columns) group_total += counts[c];
        for (size_t c : group.columns) {
            if (group_total == 0.0) {
                row.cells[c] = zero_cell;
            } else {
                row.cells[c] = to_cell(percentage(counts[c], group_total));
            }
        }
    }
    return row;
}

// ---------------------------------------------------------------------------
// Summary statistics
// ---------------------------------------------------------------------------

// Rating: weighted mean of OptionValue (else the numeric OptionText) over
// options not excluded from the index.
inline std::optional<SummaryStatistic> rating_mean(const Column& col,
                                                   const std::vector<OptionDef>& options,
                                                   const WeightSequence& weights,
                                                   std::span<const size_t> rows) {
    SummaryStatistic stat;
    stat.name = "Mean";
    stat.kind = RowKind::AVERAGE;
    double sw = 0.0, swx = 0.0;
    for (size_t r : rows) {
        if (col.is_missing(r)) continue;
        for (const auto& opt : options) {
            if (opt.exclude_from_index) continue;
            if (!col.matches(r, opt.option_text)) continue;
            std::optional<double> v = opt.option_value.has_value()
                                          ? opt.option_value
                                          : text_utils::parse_number(opt.option_text);
            if (v.has_value()) {
                stat.values.push_back(*v);
                stat.weights.push_back(weights.values[r]);
                sw += weights.values[r];
                swx += weights.values[r] * *v;
            }
            break;
        }
    }
    if (stat.values.empty() || sw <= 0.0) return std::nullopt;
    stat.value = swx / sw;
    return stat;
}

// Likert: sum(w * Index_Weight) / sum(w) over options carrying an index weight.
inline std::optional<SummaryStatistic> likert_index(const Column& col,
                                                    const std::vector<OptionDef>& options,
                                                    const WeightSequence& weights,
                                                    std::span<const size_t> rows) {
    SummaryStatistic stat;
    stat.name = "Index";
    stat.kind = RowKind::INDEX;
    bool any_indexed = false;
    for (const auto& opt : options) {
        if (opt.index_weight.has_value()) any_indexed = true;
    }
    if (!any_indexed) return std::nullopt;

    double sw = 0.0, swx = 0.0;
    for (size_t r : rows) {
        for (const auto& opt : options) {
            if (!opt.index_weight.has_value()) continue;
            if (!col.matches(r, opt.option_text)) continue;
            stat.values.push_back(*opt.index_weight);
            stat.weights.push_back(weights.values[r]);
            sw += weights.values[r];
            swx += weights.values[r] * *opt.index_weight;
            break;
        }
    }
    if (sw <= 0.0) return std::nullopt;
    stat.value = swx / sw;
    return stat;
}

constexpr std::array<const char*, 4> NPS_NON_RESPONSES = {"DK", "Don't know",
                                                          "Not applicable", "NA"};

// NPS: %promoters (>= 9) minus %detractors (<= 6). Zero is a valid score.
inline std::optional<SummaryStatistic> nps_score(const Column& col,
                                                 const WeightSequence& weights,
                                                 std::span<const size_t> rows) {
    SummaryStatistic stat;
    stat.name = "NPS Score";
    stat.kind = RowKind::SCORE;
    double promoters = 0.0, detractors = 0.0, total = 0.0;
    for (size_t r : rows) {
        auto text = col.text_at(r);
        if (!text.has_value()) continue;
        std::string t = text_utils::trim(*text);
        if (t.empty()) continue;
        bool non_response = false;
        for (const char* nr : NPS_NON_RESPONSES) {
            if (t == nr) non_response = true;
        }
        if (non_response) continue;
        auto score = col.number_at(r);
        if (!score.has_value()) continue;

        double w = weights.values[r];
        stat.values.push_back(*score);
        stat.weights.push_back(w);
        total += w;
        if (*score >= 9.0) promoters += w;
        if (*score <= 6.0) detractors += w;
    }
    if (stat.values.empty() || total <= 0.0) return std::nullopt;
    stat.value = (promoters - detractors) / total * 100.0;
    return stat;
}

// Dispatch on question type; types without a summary statistic yield nullopt.
inline std::optional<SummaryStatistic> summary_statistic(const RespondentTable& table,
                                                         const QuestionDef& q,
                                                         const std::vector<OptionDef>& options,
                                                         const WeightSequence& weights,
                                                         std::span<const size_t> rows) {
    const Column* col = table.find_column(q.code);
    switch (q.type) {
        case VariableType::RATING:
            if (!col) return std::nullopt;
            return rating_mean(*col, options, weights, rows);
        case VariableType::LIKERT:
            if (!col) return std::nullopt;
            return likert_index(*col, options, weights, rows);
        case VariableType::NPS:
            if (!col) return std::nullopt;
            return nps_score(*col, weights, rows);
        case VariableType::SINGLE_RESPONSE:
        case VariableType::MULTI_MENTION:
        case VariableType::NUMERIC:
        case VariableType::RANKING:
        case VariableType::OPEN_END:
            return std::nullopt;
    }
    return std::nullopt;
}

// Per-segment bases for every banner column.
inline std::vector<BaseSize> compute_bases(const RowIndexMap& index_map,
                                           const WeightSequence& weights) {
    std::vector<BaseSize> bases;
    bases.reserve(index_map.size());
    for (size_t c = 0; c < index_map.size(); ++c) {
        bases.push_back(weighting::compute_base(weights, index_map.rows(c)));
    }
    return bases;
}

}  // namespace cells
