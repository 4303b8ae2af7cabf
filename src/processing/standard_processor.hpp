#pragma once

#include "cells/cell_calculator.hpp"
#include "cells/question_table.hpp"
#include "processing/question_context.hpp"
#include "significance/chi_square.hpp"
#include "significance/sig_letters.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Standard processor: Single_Response, Multi_Mention, Rating, Likert, NPS
//
// Row order: per option (Frequency, Column %, Sig., Row %), per box category
// (same layout), ChiSquare, NET POSITIVE, then the summary statistic with its
// StdDev and Sig. rows.
// ---------------------------------------------------------------------------
namespace processing {

// Physical data columns of the question. Multi_Mention reads <code>_1..k.
inline std::vector<const Column*> question_columns(const QuestionContext& ctx) {
    const QuestionDef& q = ctx.question;
    std::vector<const Column*> cols;
    if (q.type != VariableType::MULTI_MENTION) {
        cols.push_back(&ctx.table.column(q.code));
        return cols;
    }
    if (q.columns.value_or(0) < 1) {
        throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Invalid Columns",
                            "Multi_Mention question " + q.code + " needs a positive Columns count",
                            "Mention columns cannot be located.",
                            "Set Columns in the Questions sheet.");
    }
    for (const auto& name : q.mention_columns()) {
        if (const Column* c = ctx.table.find_column(name)) cols.push_back(c);
    }
    if (cols.empty()) {
        throw CrosstabError(ErrorCode::DATA_COLUMN_NOT_FOUND, "Mention Columns Not Found",
                            "No " + q.code + "_1.." + q.code + "_" +
                                std::to_string(*q.columns) + " columns in the data",
                            "The question cannot be tabulated.",
                            "Check the data file header against the Columns count.");
    }
    return cols;
}

namespace detail {

// Frequency / Column % / Sig. / Row % block for one set of counts.
inline void append_count_rows(std::vector<QuestionRow>& rows, const QuestionContext& ctx,
                              const std::string& label, const std::vector<double>& counts,
                              bool show_freq, bool show_col, bool show_row) {
    if (show_freq) rows.push_back(cells::frequency_row(label, counts));
    if (show_col) {
        rows.push_back(cells::column_pct_row(label, counts, ctx.bases, ctx.is_weighted()));
        if (ctx.testing()) {
            rows.push_back(significance::proportion_letters(
                ctx.structure, counts, ctx.bases, ctx.sig_settings(), ctx.code(), label, ctx.diag));
        }
    }
    if (show_row) {
        rows.push_back(cells::row_pct_row(label, counts, ctx.structure,
                                          ctx.cfg.zero_division_as_blank));
    }
}

inline std::vector<std::string> category_values(const std::vector<OptionDef>& options,
                                                const std::string& category) {
    std::vector<std::string> values;
    for (const auto& o : options) {
        if (o.box_category == category) values.push_back(o.option_text);
    }
    return values;
}

// DK / NA style categories never count as the bottom of a scale.
inline bool is_non_substantive(const std::string& category) {
    std::string c = text_utils::to_lower(text_utils::trim(category));
    return c == "dk" || c == "na" || c == "n/a" ||
           c.find("don't know") != std::string::npos ||
           c.find("not applicable") != std::string::npos;
}

// Box categories ordered by the smallest DisplayOrder among their options;
// empty when any category has no DisplayOrder.
inline std::vector<std::string> ordered_categories(const SurveyStructure& survey,
                                                   const std::string& code) {
    std::vector<std::pair<double, std::string>> keyed;
    for (const auto& cat : survey.box_categories(code)) {
        std::optional<double> lowest;
        for (const auto& o : survey.options(code)) {
            if (o.box_category != cat || !o.display_order.has_value()) continue;
            lowest = lowest.has_value() ? std::min(*lowest, *o.display_order) : *o.display_order;
        }
        if (!lowest.has_value()) return {};
        keyed.emplace_back(*lowest, cat);
    }
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::string> out;
    for (auto& k : keyed) out.push_back(std::move(k.second));
    return out;
}

}  // namespace detail

// One ChiSquare row per banner group over the box-category counts.
inline std::vector<QuestionRow> chi_square_rows(const QuestionContext& ctx,
                                                const std::vector<std::string>& categories,
                                                const std::vector<std::vector<double>>& counts) {
    std::vector<QuestionRow> rows;
    if (categories.size() < 2) return rows;
    bool prefix = ctx.structure.groups().size() > 1;
    for (const auto& group : ctx.structure.groups()) {
        std::vector<std::vector<double>> observed(categories.size());
        std::vector<std::string> segment_labels;
        for (size_t c : group.columns) segment_labels.push_back(ctx.structure.columns()[c].label);
        for (size_t r = 0; r < categories.size(); ++r) {
            for (size_t c : group.columns) observed[r].push_back(counts[r][c]);
        }
        ChiSquareResult res =
            chi_square::test_independence(observed, categories, segment_labels, ctx.cfg.alpha);
        if (!res.ran) {
            ctx.diag.skipped_test(ctx.code(), "chi-square " + group.label, res.skip_reason);
            continue;
        }
        QuestionRow row;
        row.label = prefix ? group.label + ": " + res.message() : res.message();
        row.kind = RowKind::CHI_SQUARE;
        row.cells.assign(ctx.structure.size(), std::monostate{});
        rows.push_back(std::move(row));
    }
    return rows;
}

// NET POSITIVE (bottom - top) as bottom% minus top% on the percent base.
inline std::optional<QuestionRow> net_positive_row(
    const QuestionContext& ctx, const std::vector<std::string>& categories,
    const std::vector<std::vector<double>>& counts) {
    std::vector<std::string> ordered = detail::ordered_categories(ctx.survey, ctx.code());
    if (ordered.size() < 2) return std::nullopt;

    std::string top = ordered.front();
    std::vector<std::string> substantive;
    for (const auto& c : ordered) {
        if (!detail::is_non_substantive(c)) substantive.push_back(c);
    }
    std::string bottom = substantive.size() < 2 ? ordered.back() : substantive.back();
    if (top == bottom) return std::nullopt;

    auto index_of = [&](const std::string& cat) {
        return static_cast<size_t>(std::find(categories.begin(), categories.end(), cat) -
                                   categories.begin());
    };
    const auto& top_counts = counts[index_of(top)];
    const auto& bottom_counts = counts[index_of(bottom)];

    QuestionRow row;
    row.label = "NET POSITIVE (" + bottom + " - " + top + ")";
    row.kind = RowKind::COLUMN_PCT;
    for (size_t c = 0; c < ctx.structure.size(); ++c) {
        double base = ctx.bases[c].percent_base(ctx.is_weighted());
        if (base <= 0.0) {
            row.cells.emplace_back(std::monostate{});
            continue;
        }
        row.cells.emplace_back((bottom_counts[c] - top_counts[c]) / base * 100.0);
    }
    return row;
}

// Summary statistic (Mean / Index / NPS Score) with StdDev and Sig. rows.
inline std::vector<QuestionRow> summary_rows(const QuestionContext& ctx) {
    std::vector<QuestionRow> rows;
    const auto& options = ctx.survey.options(ctx.code());

    std::vector<std::optional<SummaryStatistic>> stats;
    std::optional<SummaryStatistic> first;
    for (size_t c = 0; c < ctx.index_map.size(); ++c) {
        stats.push_back(cells::summary_statistic(ctx.table, ctx.question, options, ctx.weights,
                                                 ctx.index_map.rows(c)));
        if (!first.has_value() && stats.back().has_value()) first = stats.back();
    }
    if (!first.has_value()) return rows;

    QuestionRow value_row;
    value_row.label = first->name;
    value_row.kind = first->kind;
    QuestionRow sd_row;
    sd_row.label = "Standard Deviation";
    sd_row.kind = RowKind::STD_DEV;
    std::vector<std::optional<MeanSample>> samples;
    for (const auto& s : stats) {
        if (!s.has_value()) {
            value_row.cells.emplace_back(std::monostate{});
            sd_row.cells.emplace_back(std::monostate{});
            samples.emplace_back(std::nullopt);
            continue;
        }
        value_row.cells.emplace_back(s->value);
        sd_row.cells.push_back(cells::to_cell(weighting::weighted_sd(s->values, s->weights)));
        samples.emplace_back(MeanSample{s->values, s->weights});
    }

    rows.push_back(value_row);
    if (ctx.cfg.show_standard_deviation) rows.push_back(std::move(sd_row));
    if (ctx.testing()) {
        rows.push_back(significance::mean_letters(ctx.structure, samples, ctx.sig_settings(),
                                                  ctx.code(), value_row.label, ctx.diag));
    }
    return rows;
}

inline std::vector<QuestionRow> process_standard(const QuestionContext& ctx) {
    const CrosstabConfig& cfg = ctx.cfg;
    std::vector<const Column*> data_cols = question_columns(ctx);
    std::vector<QuestionRow> rows;

    for (const auto& opt : ctx.survey.display_options(ctx.code())) {
        std::vector<double> counts =
            cells::row_counts(ctx.index_map, ctx.weights, data_cols, {opt.option_text});
        detail::append_count_rows(rows, ctx, opt.label(), counts, cfg.show_frequency,
                                  cfg.show_percent_column, cfg.show_percent_row);
    }

    std::vector<std::string> categories = ctx.survey.box_categories(ctx.code());
    std::vector<std::vector<double>> category_counts;
    for (const auto& cat : categories) {
        category_counts.push_back(cells::row_counts(
            ctx.index_map, ctx.weights, data_cols,
            detail::category_values(ctx.survey.options(ctx.code()), cat)));
        detail::append_count_rows(rows, ctx, cat, category_counts.back(),
                                  cfg.boxcategory_frequency, cfg.boxcategory_percent_column,
                                  cfg.boxcategory_percent_row);
    }
    if (cfg.enable_chi_square) {
        for (auto& r : chi_square_rows(ctx, categories, category_counts)) {
            rows.push_back(std::move(r));
        }
    }
    if (cfg.show_net_positive && !categories.empty()) {
        if (auto net = net_positive_row(ctx, categories, category_counts)) {
            rows.push_back(std::move(*net));
        }
    }

    for (auto& r : summary_rows(ctx)) rows.push_back(std::move(r));
    return rows;
}

}  // namespace processing
