#pragma once

#include "data/segment_key.hpp"
#include "data/survey_structure.hpp"
#include "weighting/bases.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// RowKind — closed set of output row types
// ---------------------------------------------------------------------------
enum class RowKind {
    FREQUENCY,
    COLUMN_PCT,
    ROW_PCT,
    AVERAGE,
    INDEX,
    SCORE,
    STD_DEV,
    MEDIAN,
    MODE,
    OUTLIERS,
    SIG,
    CHI_SQUARE,
};

inline const char* row_kind_str(RowKind k) {
    switch (k) {
        case RowKind::FREQUENCY:  return "Frequency";
        case RowKind::COLUMN_PCT: return "Column %";
        case RowKind::ROW_PCT:    return "Row %";
        case RowKind::AVERAGE:    return "Average";
        case RowKind::INDEX:      return "Index";
        case RowKind::SCORE:      return "Score";
        case RowKind::STD_DEV:    return "StdDev";
        case RowKind::MEDIAN:     return "Median";
        case RowKind::MODE:       return "Mode";
        case RowKind::OUTLIERS:   return "Outliers";
        case RowKind::SIG:        return "Sig.";
        case RowKind::CHI_SQUARE: return "ChiSquare";
    }
    return "Unknown";
}

inline RowKind parse_row_kind(const std::string& s) {
    for (RowKind k : {RowKind::FREQUENCY, RowKind::COLUMN_PCT, RowKind::ROW_PCT,
                      RowKind::AVERAGE, RowKind::INDEX, RowKind::SCORE, RowKind::STD_DEV,
                      RowKind::MEDIAN, RowKind::MODE, RowKind::OUTLIERS, RowKind::SIG,
                      RowKind::CHI_SQUARE}) {
        if (s == row_kind_str(k)) return k;
    }
    throw std::invalid_argument("Unknown row kind: " + s);
}

// ---------------------------------------------------------------------------
// Cell — one value of a QuestionRow
// monostate = undefined/blank, double = numeric statistic (unrounded),
// string = letters or message text.
// ---------------------------------------------------------------------------
using Cell = std::variant<std::monostate, double, std::string>;

inline bool is_blank(const Cell& c) { return std::holds_alternative<std::monostate>(c); }

// ---------------------------------------------------------------------------
// QuestionRow / QuestionTable
// Every row holds exactly one cell per banner column, in banner order.
// ---------------------------------------------------------------------------
struct QuestionRow {
    std::string label;
    RowKind kind = RowKind::FREQUENCY;
    std::vector<Cell> cells;
};

struct QuestionTable {
    std::string question_code;
    std::string question_text;
    VariableType type = VariableType::SINGLE_RESPONSE;
    std::string base_filter;
    std::vector<SegmentKey> keys;
    std::vector<BaseSize> bases;
    std::vector<QuestionRow> rows;

    const QuestionRow* find_row(const std::string& label, RowKind kind) const {
        for (const auto& r : rows) {
            if (r.label == label && r.kind == kind) return &r;
        }
        return nullptr;
    }

    // Row following `row` (e.g. the Sig. row after a Column % row).
    const QuestionRow* next_row(const QuestionRow* row) const {
        if (!row) return nullptr;
        size_t idx = static_cast<size_t>(row - rows.data());
        if (idx + 1 >= rows.size()) return nullptr;
        return &rows[idx + 1];
    }
};
