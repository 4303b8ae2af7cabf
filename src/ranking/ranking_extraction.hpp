#pragma once

#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "ranking/ranking_matrix.hpp"
#include "text_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class RankingFormat { POSITION, ITEM };
enum class RankDirection { BEST_TO_WORST, WORST_TO_BEST };

namespace ranking {

inline RankingFormat parse_format(const QuestionDef& q) {
    std::string f = text_utils::trim(q.ranking_format);
    if (f == "Position") return RankingFormat::POSITION;
    if (f == "Item") return RankingFormat::ITEM;
    throw CrosstabError(ErrorCode::CFG_INVALID_RANKING_FORMAT, "Invalid Ranking_Format",
                        "Question " + q.code + " has Ranking_Format '" + q.ranking_format +
                            "'; must be 'Position' or 'Item'",
                        "The ranking columns cannot be interpreted.",
                        "Set Ranking_Format to Position or Item in the Questions sheet.");
}

inline RankDirection parse_direction(const std::string& text) {
    std::string d = text_utils::trim(text);
    if (d == "WorstToBest" || d == "Worst_to_Best" || d == "worst_to_best") {
        return RankDirection::WORST_TO_BEST;
    }
    return RankDirection::BEST_TO_WORST;
}

// Ranking_Positions, else Columns.
inline int num_positions(const QuestionDef& q) {
    std::optional<int> n = q.ranking_positions.has_value() ? q.ranking_positions : q.columns;
    if (!n.has_value() || *n < 1) {
        throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Invalid Ranking_Positions",
                            "Question " + q.code + " has no positive Ranking_Positions or Columns",
                            "The valid rank range is unknown.",
                            "Set Ranking_Positions or Columns to a positive integer.");
    }
    return *n;
}

namespace detail {

inline std::vector<OptionDef> ordered_options(const SurveyStructure& survey,
                                              const std::string& code) {
    std::vector<OptionDef> opts = survey.options(code);
    SurveyStructure::sort_by_display_order(opts);
    return opts;
}

inline std::string item_name(const OptionDef& opt) {
    return text_utils::trim(opt.label());
}

// Rank digits after the last "Rank" in the column name, e.g. Q7_Rank2 -> 2.
inline std::optional<int> rank_from_column(const std::string& col) {
    size_t pos = col.rfind("Rank");
    if (pos == std::string::npos) return std::nullopt;
    std::string digits;
    for (size_t i = pos + 4; i < col.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(col[i]))) digits += col[i];
    }
    if (digits.empty()) return std::nullopt;
    return std::stoi(digits);
}

}  // namespace detail

// Position format: one column per item holding the rank it received.
// Item columns are the OptionText names when any exist, else Code_OptionText.
inline RankingMatrix extract_position(const RespondentTable& table, const QuestionDef& q,
                                      const std::vector<OptionDef>& options, int positions) {
    bool direct = false;
    for (const auto& opt : options) {
        if (table.has_column(opt.option_text)) direct = true;
    }

    std::vector<std::string> items;
    std::vector<const Column*> cols;
    std::vector<std::string> expected;
    for (const auto& opt : options) {
        std::string name = direct ? opt.option_text : q.code + "_" + opt.option_text;
        expected.push_back(name);
        const Column* col = table.find_column(name);
        if (!col) continue;
        items.push_back(detail::item_name(opt));
        cols.push_back(col);
    }
    if (cols.empty()) {
        std::string list;
        for (const auto& e : expected) list += (list.empty() ? "" : ", ") + e;
        throw CrosstabError(ErrorCode::DATA_COLUMN_NOT_FOUND, "Ranking Columns Not Found",
                            "Question " + q.code + ": none of the item columns exist",
                            "No ranking data can be extracted.",
                            "Expected columns: " + list);
    }

    RankingMatrix m(table.row_count(), items, positions);
    for (size_t i = 0; i < cols.size(); ++i) {
        for (size_t r = 0; r < table.row_count(); ++r) {
            m.set(r, i, cols[i]->number_at(r));
        }
    }
    return m;
}

// Item format: columns Code_Rank1..Code_RankP each name the item placed at
// that position.
inline RankingMatrix extract_item(const RespondentTable& table, const QuestionDef& q,
                                  const std::vector<OptionDef>& options, int positions) {
    std::vector<std::string> items;
    std::map<std::string, size_t> item_of_value;
    for (const auto& opt : options) {
        item_of_value[text_utils::trim(opt.option_text)] = items.size();
        items.push_back(detail::item_name(opt));
    }

    std::vector<std::string> existing;
    std::string expected;
    for (int p = 1; p <= positions; ++p) {
        std::string name = q.code + "_Rank" + std::to_string(p);
        expected += (expected.empty() ? "" : ", ") + name;
        if (table.has_column(name)) existing.push_back(name);
    }
    if (existing.empty()) {
        throw CrosstabError(ErrorCode::DATA_COLUMN_NOT_FOUND, "Ranking Columns Not Found",
                            "Question " + q.code + ": no ranking columns found in data",
                            "No ranking data can be extracted.",
                            "Expected columns: " + expected);
    }

    RankingMatrix m(table.row_count(), items, positions);
    for (const auto& name : existing) {
        auto rank = detail::rank_from_column(name);
        if (!rank.has_value() || *rank < 1 || *rank > positions) {
            throw CrosstabError(ErrorCode::DATA_INVALID_FORMAT, "Invalid Rank Column Name",
                                "Question " + q.code + ": cannot parse rank position from '" +
                                    name + "'",
                                "Item format needs Code_Rank# column names.",
                                "Expected rank positions 1 to " + std::to_string(positions) + ".");
        }
        const Column& col = table.column(name);
        for (size_t r = 0; r < table.row_count(); ++r) {
            auto text = col.text_at(r);
            if (!text.has_value()) continue;
            auto it = item_of_value.find(text_utils::trim(*text));
            if (it == item_of_value.end()) continue;
            m.set(r, it->second, static_cast<double>(*rank));
        }
    }
    return m;
}

// rank' = (P + 1) - rank; missing stays missing.
inline RankingMatrix flip_direction(const RankingMatrix& m) {
    RankingMatrix out = m;
    double top = static_cast<double>(m.num_positions()) + 1.0;
    for (size_t r = 0; r < m.rows(); ++r) {
        for (size_t i = 0; i < m.item_count(); ++i) {
            const auto& v = m.at(r, i);
            if (v.has_value()) out.set(r, i, top - *v);
        }
    }
    return out;
}

inline RankingMatrix normalize_direction(const RankingMatrix& m, RankDirection direction) {
    if (direction == RankDirection::WORST_TO_BEST) return flip_direction(m);
    return m;
}

// Extract and normalize to best-to-worst (1 = best).
inline RankingMatrix extract(const RespondentTable& table, const SurveyStructure& survey,
                             const QuestionDef& q) {
    RankingFormat format = parse_format(q);
    int positions = num_positions(q);
    std::vector<OptionDef> options = detail::ordered_options(survey, q.code);
    if (options.empty()) {
        throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Ranking Options Missing",
                            "Question " + q.code + " has no options defined",
                            "Ranking items are defined by the options.",
                            "Add the ranked items to the Options sheet.");
    }
    RankingMatrix m = format == RankingFormat::POSITION
                          ? extract_position(table, q, options, positions)
                          : extract_item(table, q, options, positions);
    return normalize_direction(m, parse_direction(q.ranking_direction));
}

}  // namespace ranking
