#pragma once

#include "cells/question_table.hpp"
#include "config/crosstab_config.hpp"
#include "runner/crosstab_runner.hpp"
#include "text_utils.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// OutputRow — one printable row of the wide crosstab layout
// ---------------------------------------------------------------------------
struct OutputRow {
    std::string question_code;
    std::string question_text;
    std::string label;
    std::string row_type;
    std::vector<std::string> cells;     // one per banner column
};

namespace tab_io {

constexpr const char* BASE_ROW_LABEL = "Base (n=)";
constexpr const char* UNWEIGHTED_BASE_LABEL = "Base (unweighted)";
constexpr const char* WEIGHTED_BASE_LABEL = "Base (weighted)";
constexpr const char* EFFECTIVE_BASE_LABEL = "Effective base";
constexpr const char* BASE_ROW_TYPE = "Base";

// Decimal places for a value of the given row kind. Statistics of Numeric
// questions use the numeric setting.
inline int decimals_for(RowKind kind, VariableType type, const CrosstabConfig& cfg) {
    switch (kind) {
        case RowKind::FREQUENCY:
        case RowKind::OUTLIERS:
            return 0;
        case RowKind::COLUMN_PCT:
        case RowKind::ROW_PCT:
            return cfg.decimal_places_percent;
        case RowKind::INDEX:
        case RowKind::SCORE:
            return cfg.decimal_places_index;
        case RowKind::AVERAGE:
        case RowKind::STD_DEV:
            return type == VariableType::NUMERIC ? cfg.decimal_places_numeric
                                                 : cfg.decimal_places_ratings;
        case RowKind::MEDIAN:
        case RowKind::MODE:
            return cfg.decimal_places_numeric;
        case RowKind::SIG:
        case RowKind::CHI_SQUARE:
            return 2;
    }
    return 2;
}

inline std::string format_value(double v, int decimals) {
    if (std::isnan(v)) return "";
    double rounded = text_utils::round_to(v, decimals);
    if (rounded == 0.0) rounded = 0.0;   // no "-0"
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, rounded);
    return buf;
}

// Rounded text of one cell. Undefined cells are empty.
inline std::string format_cell(const Cell& cell, RowKind kind, VariableType type,
                               const CrosstabConfig& cfg) {
    if (const auto* d = std::get_if<double>(&cell)) {
        return format_value(*d, decimals_for(kind, type, cfg));
    }
    if (const auto* s = std::get_if<std::string>(&cell)) return *s;
    return "";
}

namespace detail {

inline OutputRow base_row(const QuestionTable& t, const std::string& label,
                          double BaseSize::*member) {
    OutputRow row{t.question_code, t.question_text, label, BASE_ROW_TYPE, {}};
    for (const auto& b : t.bases) row.cells.push_back(format_value(b.*member, 0));
    return row;
}

}  // namespace detail

// Base rows, then every row with its cells formatted.
inline std::vector<OutputRow> flatten(const QuestionTable& t, bool weighted,
                                      const CrosstabConfig& cfg) {
    std::vector<OutputRow> out;
    if (weighted) {
        if (cfg.show_unweighted_n) {
            out.push_back(detail::base_row(t, UNWEIGHTED_BASE_LABEL, &BaseSize::unweighted));
        }
        out.push_back(detail::base_row(t, WEIGHTED_BASE_LABEL, &BaseSize::weighted));
        if (cfg.show_effective_n) {
            out.push_back(detail::base_row(t, EFFECTIVE_BASE_LABEL, &BaseSize::effective));
        }
    } else {
        out.push_back(detail::base_row(t, BASE_ROW_LABEL, &BaseSize::unweighted));
    }

    for (const auto& r : t.rows) {
        OutputRow row{t.question_code, t.question_text, r.label, row_kind_str(r.kind), {}};
        for (const auto& c : r.cells) row.cells.push_back(format_cell(c, r.kind, t.type, cfg));
        out.push_back(std::move(row));
    }
    return out;
}

inline std::vector<OutputRow> flatten(const RunReport& report, const CrosstabConfig& cfg) {
    std::vector<OutputRow> out;
    for (const auto& t : report.tables) {
        for (auto& r : flatten(t, report.weighted, cfg)) out.push_back(std::move(r));
    }
    return out;
}

}  // namespace tab_io
