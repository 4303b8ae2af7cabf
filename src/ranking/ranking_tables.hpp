#pragma once

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "cells/cell_calculator.hpp"
#include "cells/question_table.hpp"
#include "config/crosstab_config.hpp"
#include "ranking/ranking_context.hpp"
#include "ranking/ranking_extraction.hpp"
#include "ranking/ranking_metrics.hpp"
#include "ranking/ranking_validation.hpp"
#include "significance/sig_letters.hpp"

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ranking {

inline RankingThresholds thresholds_from(const CrosstabConfig& cfg) {
    RankingThresholds t;
    t.tie_pct = cfg.ranking_tie_threshold_pct;
    t.gap_pct = cfg.ranking_gap_threshold_pct;
    t.completeness_pct = cfg.ranking_completeness_threshold_pct;
    return t;
}

// top_n clamped to the available positions.
inline int effective_top_n(int top_n, int positions, RankingContext& ctx) {
    if (top_n <= positions) return top_n;
    char buf[128];
    std::snprintf(buf, sizeof(buf), "top_n (%d) exceeds available positions (%d), clamping to %d",
                  top_n, positions, positions);
    ctx.warn(buf);
    return positions;
}

namespace detail {

inline QuestionRow share_row(const std::string& label, const std::vector<RankShare>& shares) {
    QuestionRow row;
    row.label = label;
    row.kind = RowKind::COLUMN_PCT;
    for (const auto& s : shares) row.cells.push_back(cells::to_cell(s.percentage()));
    return row;
}

inline QuestionRow share_letters(const BannerStructure& structure,
                                 const std::vector<RankShare>& shares,
                                 const SigSettings& settings, const std::string& scope,
                                 RankingContext& ctx) {
    auto compare = [&](size_t i, size_t j, double alpha) {
        ProportionSample a{shares[i].count, shares[i].base, shares[i].effective_n};
        ProportionSample b{shares[j].count, shares[j].base, shares[j].effective_n};
        return z_test_proportions(a, b, settings.is_weighted, settings.min_base, alpha);
    };
    return significance::letters_row(structure, compare, settings,
                                     SigDirection::HIGHER_IS_BETTER, ctx.question_code, scope,
                                     ctx.diag);
}

}  // namespace detail

// Rows for every item: % ranked first, mean rank and (optionally) % top N,
// each followed by its Sig. row when testing is on.
inline std::vector<QuestionRow> build_rows(const RankingMatrix& m,
                                           const BannerStructure& structure,
                                           const RowIndexMap& index_map,
                                           const WeightSequence& weights,
                                           const CrosstabConfig& cfg, RankingContext& ctx) {
    SigSettings settings;
    settings.alpha = cfg.alpha;
    settings.min_base = cfg.significance_min_base;
    settings.bonferroni = cfg.bonferroni_correction;
    settings.is_weighted = weights.weighted;
    bool sig = cfg.enable_significance_testing;

    int top_n = cfg.ranking_show_top_n ? effective_top_n(cfg.ranking_top_n, m.num_positions(), ctx)
                                       : 0;

    std::vector<QuestionRow> rows;
    for (size_t item = 0; item < m.item_count(); ++item) {
        const std::string& name = m.items()[item];

        std::vector<RankShare> first;
        std::vector<std::optional<MeanSample>> samples;
        QuestionRow mean_row;
        mean_row.label = name + " - Mean Rank (Lower = Better)";
        mean_row.kind = RowKind::AVERAGE;
        bool any_ranked = false;
        for (size_t c = 0; c < index_map.size(); ++c) {
            first.push_back(pct_first(m, item, weights, index_map.rows(c)));
            MeanSample s = rank_sample(m, item, weights, index_map.rows(c));
            auto mean = weighting::weighted_mean(s.values, s.weights);
            mean_row.cells.push_back(cells::to_cell(mean));
            if (mean.has_value()) {
                any_ranked = true;
                samples.emplace_back(std::move(s));
            } else {
                samples.emplace_back(std::nullopt);
            }
        }
        if (!any_ranked) ctx.item_failed(name, "no respondent ranked this item");

        std::string first_label = name + " - % Ranked 1st";
        rows.push_back(detail::share_row(first_label, first));
        if (sig) rows.push_back(detail::share_letters(structure, first, settings, first_label, ctx));

        rows.push_back(mean_row);
        if (sig) {
            rows.push_back(significance::mean_letters(structure, samples, settings,
                                                      ctx.question_code, mean_row.label,
                                                      ctx.diag, SigDirection::LOWER_IS_BETTER));
        }

        if (top_n > 0) {
            std::vector<RankShare> top;
            for (size_t c = 0; c < index_map.size(); ++c) {
                top.push_back(pct_top_n(m, item, top_n, weights, index_map.rows(c)));
            }
            std::string top_label = name + " - % Top " + std::to_string(top_n);
            rows.push_back(detail::share_row(top_label, top));
            if (sig) rows.push_back(detail::share_letters(structure, top, settings, top_label, ctx));
        }
    }
    return rows;
}

// Full ranking pipeline for one question: extract, normalize, validate,
// tabulate.
inline std::vector<QuestionRow> process(const RespondentTable& table,
                                        const SurveyStructure& survey, const QuestionDef& q,
                                        const BannerStructure& structure,
                                        const RowIndexMap& index_map,
                                        const WeightSequence& weights,
                                        const CrosstabConfig& cfg, RankingContext& ctx) {
    RankingMatrix m = extract(table, survey, q);
    RankingQuality quality = validate(m, thresholds_from(cfg));
    if (quality.has_issues) ctx.warn(quality.summary());
    return build_rows(m, structure, index_map, weights, cfg, ctx);
}

}  // namespace ranking
