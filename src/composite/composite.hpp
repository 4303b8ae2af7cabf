#pragma once

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "cells/cell_calculator.hpp"
#include "cells/question_table.hpp"
#include "config/crosstab_config.hpp"
#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "significance/sig_letters.hpp"
#include "text_utils.hpp"
#include "weighting/weights.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class CompositeCalculation { MEAN, SUM, WEIGHTED_MEAN };

inline const char* composite_calculation_str(CompositeCalculation c) {
    switch (c) {
        case CompositeCalculation::MEAN:          return "Mean";
        case CompositeCalculation::SUM:           return "Sum";
        case CompositeCalculation::WEIGHTED_MEAN: return "WeightedMean";
    }
    return "Mean";
}

// ---------------------------------------------------------------------------
// CompositeDefinition — one row of the Composite_Metrics sheet
// Fields hold the sheet text; validate_definitions checks them before use.
// ---------------------------------------------------------------------------
struct CompositeDefinition {
    std::string code;
    std::string label;
    std::string calculation_type = "Mean";
    std::vector<std::string> sources;
    std::string weights_text;          // comma-separated, WeightedMean only
    bool exclude_from_summary = false;

    const std::string& display_label() const { return label.empty() ? code : label; }
};

struct CompositeIssue {
    ErrorCode code;
    std::string message;
};

struct CompositeValidation {
    std::vector<CompositeIssue> errors;
    std::vector<std::string> warnings;

    bool ok() const { return errors.empty(); }
};

namespace composite {

constexpr double NA = std::numeric_limits<double>::quiet_NaN();

inline std::optional<CompositeCalculation> parse_calculation(const std::string& text) {
    std::string t = text_utils::trim(text);
    if (t == "Mean") return CompositeCalculation::MEAN;
    if (t == "Sum") return CompositeCalculation::SUM;
    if (t == "WeightedMean") return CompositeCalculation::WEIGHTED_MEAN;
    return std::nullopt;
}

// Parsed weights, or nullopt when any entry is not a number.
inline std::optional<std::vector<double>> parse_weights(const std::string& text) {
    std::vector<double> out;
    for (const auto& piece : text_utils::split(text, ',')) {
        auto v = text_utils::parse_number(piece);
        if (!v.has_value()) return std::nullopt;
        out.push_back(*v);
    }
    return out;
}

inline std::string join(const std::vector<std::string>& parts) {
    std::string s;
    for (const auto& p : parts) s += (s.empty() ? "" : ", ") + p;
    return s;
}

// Check every definition against the survey structure and the data.
inline CompositeValidation validate_definitions(const std::vector<CompositeDefinition>& defs,
                                                const SurveyStructure& survey,
                                                const RespondentTable& table) {
    CompositeValidation v;
    auto error = [&](ErrorCode code, const std::string& msg) { v.errors.push_back({code, msg}); };

    std::set<std::string> seen, dups;
    for (const auto& d : defs) {
        if (!seen.insert(d.code).second) dups.insert(d.code);
        if (survey.has_question(d.code)) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  "CompositeCode '" + d.code + "' conflicts with an existing QuestionCode");
        }
    }
    if (!dups.empty()) {
        error(ErrorCode::CFG_COMPOSITE_INVALID,
              "Duplicate CompositeCode(s): " +
                  join(std::vector<std::string>(dups.begin(), dups.end())));
    }

    for (const auto& d : defs) {
        const std::string name = "Composite '" + d.code + "'";
        if (d.sources.empty()) {
            error(ErrorCode::CFG_COMPOSITE_INVALID, name + " has no SourceQuestions");
            continue;
        }

        std::vector<std::string> unknown, absent;
        std::vector<VariableType> types;
        for (const auto& s : d.sources) {
            const QuestionDef* q = survey.find_question(s);
            if (!q) {
                unknown.push_back(s);
                continue;
            }
            if (!table.has_column(s)) absent.push_back(s);
            if (std::find(types.begin(), types.end(), q->type) == types.end()) {
                types.push_back(q->type);
            }
        }
        if (!unknown.empty()) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  name + " references non-existent question(s): " + join(unknown));
        }
        if (!absent.empty()) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  name + ": question(s) not found in data: " + join(absent));
        }
        std::vector<std::string> type_names;
        bool bad_type = false;
        for (VariableType t : types) {
            type_names.push_back(variable_type_str(t));
            if (t != VariableType::RATING && t != VariableType::LIKERT &&
                t != VariableType::NUMERIC) {
                bad_type = true;
            }
        }
        if (types.size() > 1) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  name + " mixes question types: " + join(type_names));
        }
        if (bad_type) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  name + " includes unsupported question type(s): " + join(type_names) +
                      "; only Rating, Likert and Numeric are supported");
        }

        auto calc = parse_calculation(d.calculation_type);
        if (!calc.has_value()) {
            error(ErrorCode::CFG_COMPOSITE_INVALID,
                  name + " has invalid CalculationType '" + d.calculation_type +
                      "'; must be Mean, Sum or WeightedMean");
        } else if (*calc == CompositeCalculation::WEIGHTED_MEAN) {
            if (text_utils::trim(d.weights_text).empty()) {
                error(ErrorCode::CFG_COMPOSITE_WEIGHTS,
                      name + " uses WeightedMean but Weights is empty");
            } else {
                auto w = parse_weights(d.weights_text);
                if (!w.has_value()) {
                    error(ErrorCode::CFG_COMPOSITE_WEIGHTS,
                          name + " has non-numeric weights: " + d.weights_text);
                } else {
                    if (w->size() != d.sources.size()) {
                        error(ErrorCode::CFG_COMPOSITE_WEIGHTS,
                              name + " has " + std::to_string(d.sources.size()) +
                                  " source questions but " + std::to_string(w->size()) +
                                  " weights");
                    }
                    if (std::any_of(w->begin(), w->end(), [](double x) { return x <= 0.0; })) {
                        error(ErrorCode::CFG_COMPOSITE_WEIGHTS,
                              name + " has non-positive weights; all weights must be > 0");
                    }
                }
            }
        }

        if (d.sources.size() == 1) {
            v.warnings.push_back(name + " has only one source question");
        }
    }
    return v;
}

// Throw the first error's code with every message attached.
inline void require_valid(const CompositeValidation& v) {
    if (v.ok()) return;
    std::string all;
    for (const auto& e : v.errors) all += (all.empty() ? "" : "; ") + e.message;
    throw CrosstabError(v.errors.front().code, "Invalid Composite Definitions", all,
                        "Composite scores would be computed from the wrong inputs.",
                        "Fix the Composite_Metrics sheet.");
}

// Per-respondent composite over non-missing sources; NaN when all missing.
inline std::vector<double> compute_values(const RespondentTable& table,
                                          const CompositeDefinition& def) {
    auto calc = parse_calculation(def.calculation_type).value_or(CompositeCalculation::MEAN);
    std::vector<double> weights;
    if (calc == CompositeCalculation::WEIGHTED_MEAN) {
        weights = parse_weights(def.weights_text).value_or(std::vector<double>{});
        if (weights.size() != def.sources.size()) {
            throw CrosstabError(ErrorCode::CFG_COMPOSITE_WEIGHTS, "Invalid Composite Weights",
                                "Composite '" + def.code + "' weights do not match its sources",
                                "", "Run validate_definitions first.");
        }
    }

    std::vector<const Column*> cols;
    for (const auto& s : def.sources) cols.push_back(table.find_column(s));

    std::vector<double> out(table.row_count(), NA);
    for (size_t r = 0; r < table.row_count(); ++r) {
        double sum = 0.0, wsum = 0.0;
        size_t n = 0;
        for (size_t i = 0; i < cols.size(); ++i) {
            if (!cols[i]) continue;
            auto v = cols[i]->number_at(r);
            if (!v.has_value()) continue;
            double w = calc == CompositeCalculation::WEIGHTED_MEAN ? weights[i] : 1.0;
            sum += w * *v;
            wsum += w;
            ++n;
        }
        if (n == 0) continue;
        out[r] = calc == CompositeCalculation::SUM ? sum : sum / wsum;
    }
    return out;
}

// Source type of a validated composite (all sources share it).
inline VariableType source_type(const CompositeDefinition& def, const SurveyStructure& survey) {
    return survey.question(def.sources.front()).type;
}

// Summary row (+ StdDev, + Sig.) for one composite.
inline QuestionTable build_composite_table(const RespondentTable& table,
                                           const SurveyStructure& survey,
                                           const CompositeDefinition& def,
                                           const BannerStructure& structure,
                                           const RowIndexMap& index_map,
                                           const WeightSequence& weights,
                                           const CrosstabConfig& cfg, Diagnostics& diag) {
    std::vector<double> values = compute_values(table, def);
    if (std::all_of(values.begin(), values.end(), [](double x) { return std::isnan(x); })) {
        throw CrosstabError(ErrorCode::DATA_COMPOSITE_ALL_MISSING, "Composite Has No Data",
                            "Composite '" + def.code + "' is missing for every respondent",
                            "No composite score can be reported.",
                            "Check that the source questions contain numeric answers.");
    }

    VariableType type = source_type(def, survey);
    QuestionTable out;
    out.question_code = def.code;
    out.question_text = def.display_label();
    out.type = type;
    out.keys = structure.keys();
    out.bases = cells::compute_bases(index_map, weights);

    QuestionRow summary;
    summary.label = def.display_label();
    summary.kind = type == VariableType::LIKERT ? RowKind::INDEX : RowKind::AVERAGE;
    QuestionRow sd_row;
    sd_row.label = "Standard Deviation";
    sd_row.kind = RowKind::STD_DEV;

    std::vector<std::optional<MeanSample>> samples;
    for (size_t c = 0; c < index_map.size(); ++c) {
        MeanSample s;
        for (size_t r : index_map.rows(c)) {
            if (std::isnan(values[r])) continue;
            s.values.push_back(values[r]);
            s.weights.push_back(weights.values[r]);
        }
        auto mean = weighting::weighted_mean(s.values, s.weights);
        summary.cells.push_back(cells::to_cell(mean));
        sd_row.cells.push_back(cells::to_cell(weighting::weighted_sd(s.values, s.weights)));
        if (mean.has_value()) {
            samples.emplace_back(std::move(s));
        } else {
            samples.emplace_back(std::nullopt);
        }
    }

    out.rows.push_back(summary);
    if (cfg.show_standard_deviation) out.rows.push_back(sd_row);
    if (cfg.enable_significance_testing) {
        SigSettings settings{cfg.alpha, static_cast<double>(cfg.significance_min_base),
                             cfg.bonferroni_correction, weights.weighted};
        out.rows.push_back(significance::mean_letters(structure, samples, settings, def.code,
                                                      summary.label, diag));
    }
    return out;
}

}  // namespace composite
