#pragma once

#include "banner/banner_structure.hpp"
#include "composite/composite.hpp"
#include "config/crosstab_config.hpp"
#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "io/table_reader.hpp"
#include "text_utils.hpp"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Sheet readers — Questions, Options, Banner and Composites sheets
//
// Each sheet is a table with a header row. Optional columns may be absent;
// blank cells take the field default. Rows with a blank key are ignored.
// ---------------------------------------------------------------------------
namespace tab_io {

namespace detail {

class SheetRow {
public:
    SheetRow(const RespondentTable& sheet, const std::string& sheet_name, size_t row)
        : sheet_(sheet), sheet_name_(sheet_name), row_(row) {}

    std::string text(const std::string& column) const {
        const Column* col = sheet_.find_column(column);
        if (!col) return "";
        return text_utils::trim(col->text_at(row_).value_or(""));
    }

    std::optional<double> number(const std::string& column) const {
        std::string t = text(column);
        if (t.empty()) return std::nullopt;
        auto v = text_utils::parse_number(t);
        if (!v.has_value()) throw bad_cell(column, t, "a number");
        return v;
    }

    std::optional<int> whole(const std::string& column) const {
        auto v = number(column);
        if (!v.has_value()) return std::nullopt;
        if (*v != static_cast<double>(static_cast<int>(*v))) {
            throw bad_cell(column, text(column), "a whole number");
        }
        return static_cast<int>(*v);
    }

    bool flag(const std::string& column, bool fallback) const {
        std::string t = text(column);
        if (t.empty()) return fallback;
        return config_io::parse_bool(sheet_name_ + "." + column, t);
    }

private:
    CrosstabError bad_cell(const std::string& column, const std::string& value,
                           const std::string& expected) const {
        return CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Invalid Sheet Value",
                             sheet_name_ + " row " + std::to_string(row_ + 1) + ", column " +
                                 column + ": '" + value + "'",
                             "The definition cannot be interpreted.",
                             "Expected " + expected + ".");
    }

    const RespondentTable& sheet_;
    const std::string& sheet_name_;
    size_t row_;
};

inline void require_columns(const RespondentTable& sheet, const std::string& sheet_name,
                            const std::vector<std::string>& columns) {
    for (const auto& c : columns) {
        if (!sheet.has_column(c)) {
            throw CrosstabError(ErrorCode::DATA_COLUMN_NOT_FOUND, "Sheet Column Missing",
                                sheet_name + " sheet has no '" + c + "' column",
                                "Definitions in the sheet cannot be read.",
                                "Add the column header to the sheet.");
        }
    }
}

// Sheets keep "NA" and similar as literal text; only empty cells are missing.
inline RespondentTable read_sheet(const std::string& path) { return read_table(path, {""}); }

}  // namespace detail

inline SurveyStructure survey_from_sheets(const RespondentTable& questions,
                                          const RespondentTable& options) {
    const std::string q_sheet = "Questions";
    const std::string o_sheet = "Options";
    detail::require_columns(questions, q_sheet, {"QuestionCode", "Variable_Type"});
    detail::require_columns(options, o_sheet, {"QuestionCode", "OptionText"});

    SurveyStructure survey;
    for (size_t r = 0; r < questions.row_count(); ++r) {
        detail::SheetRow row(questions, q_sheet, r);
        QuestionDef q;
        q.code = row.text("QuestionCode");
        if (q.code.empty()) continue;
        if (survey.has_question(q.code)) {
            throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Duplicate Question",
                                "Question '" + q.code + "' is defined twice",
                                "Options and tables would be ambiguous.",
                                "Remove the duplicate row from the Questions sheet.");
        }
        q.text = row.text("QuestionText");
        q.type = parse_variable_type(row.text("Variable_Type"));
        q.columns = row.whole("Columns");
        q.ranking_format = row.text("Ranking_Format");
        q.ranking_positions = row.whole("Ranking_Positions");
        q.ranking_direction = row.text("Ranking_Direction");
        q.min_value = row.number("Min_Value");
        q.max_value = row.number("Max_Value");
        q.base_filter = row.text("BaseFilter");
        q.selected = row.flag("Selected", true);
        survey.add_question(std::move(q));
    }

    for (size_t r = 0; r < options.row_count(); ++r) {
        detail::SheetRow row(options, o_sheet, r);
        std::string code = row.text("QuestionCode");
        if (code.empty()) continue;
        OptionDef o;
        o.option_text = row.text("OptionText");
        o.display_text = row.text("DisplayText");
        o.display_order = row.number("DisplayOrder");
        o.show_in_output = row.flag("ShowInOutput", true);
        o.exclude_from_index = row.flag("ExcludeFromIndex", false);
        o.index_weight = row.number("Index_Weight");
        o.option_value = row.number("OptionValue");
        o.box_category = row.text("BoxCategory");
        o.min = row.number("Min");
        o.max = row.number("Max");
        survey.add_option(code, std::move(o));
    }
    return survey;
}

inline std::vector<BannerRequest> banner_from_sheet(const RespondentTable& sheet) {
    const std::string name = "Banner";
    detail::require_columns(sheet, name, {"QuestionCode"});
    std::vector<BannerRequest> requests;
    for (size_t r = 0; r < sheet.row_count(); ++r) {
        detail::SheetRow row(sheet, name, r);
        BannerRequest req;
        req.question_code = row.text("QuestionCode");
        if (req.question_code.empty()) continue;
        req.use_box_category = row.flag("BannerBoxCategory", false);
        req.banner_label = row.text("BannerLabel");
        req.display_order = row.number("DisplayOrder");
        requests.push_back(std::move(req));
    }
    return requests;
}

inline std::vector<CompositeDefinition> composites_from_sheet(const RespondentTable& sheet) {
    const std::string name = "Composites";
    detail::require_columns(sheet, name, {"CompositeCode", "SourceQuestions"});
    std::vector<CompositeDefinition> defs;
    for (size_t r = 0; r < sheet.row_count(); ++r) {
        detail::SheetRow row(sheet, name, r);
        CompositeDefinition def;
        def.code = row.text("CompositeCode");
        if (def.code.empty()) continue;
        def.label = row.text("CompositeLabel");
        std::string calc = row.text("CalculationType");
        if (!calc.empty()) def.calculation_type = calc;
        for (auto& s : text_utils::split(row.text("SourceQuestions"), ',')) {
            if (!s.empty()) def.sources.push_back(std::move(s));
        }
        def.weights_text = row.text("Weights");
        def.exclude_from_summary = row.flag("ExcludeFromSummary", false);
        defs.push_back(std::move(def));
    }
    return defs;
}

inline SurveyStructure read_survey_structure(const std::string& questions_path,
                                             const std::string& options_path) {
    return survey_from_sheets(detail::read_sheet(questions_path), detail::read_sheet(options_path));
}

inline std::vector<BannerRequest> read_banner(const std::string& path) {
    return banner_from_sheet(detail::read_sheet(path));
}

inline std::vector<CompositeDefinition> read_composites(const std::string& path) {
    return composites_from_sheet(detail::read_sheet(path));
}

}  // namespace tab_io
