#pragma once

#include "diagnostics.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// VariableType — closed set of question types
// ---------------------------------------------------------------------------
enum class VariableType {
    SINGLE_RESPONSE,
    MULTI_MENTION,
    RATING,
    LIKERT,
    NPS,
    NUMERIC,
    RANKING,
    OPEN_END,
};

inline const char* variable_type_str(VariableType t) {
    switch (t) {
        case VariableType::SINGLE_RESPONSE: return "Single_Response";
        case VariableType::MULTI_MENTION:   return "Multi_Mention";
        case VariableType::RATING:          return "Rating";
        case VariableType::LIKERT:          return "Likert";
        case VariableType::NPS:             return "NPS";
        case VariableType::NUMERIC:         return "Numeric";
        case VariableType::RANKING:         return "Ranking";
        case VariableType::OPEN_END:        return "Open_End";
    }
    return "Unknown";
}

inline VariableType parse_variable_type(const std::string& text) {
    std::string t = text_utils::to_lower(text_utils::trim(text));
    if (t == "single_response" || t == "single" || t == "single_mention") {
        return VariableType::SINGLE_RESPONSE;
    }
    if (t == "multi_mention" || t == "multi") return VariableType::MULTI_MENTION;
    if (t == "rating") return VariableType::RATING;
    if (t == "likert") return VariableType::LIKERT;
    if (t == "nps") return VariableType::NPS;
    if (t == "numeric") return VariableType::NUMERIC;
    if (t == "ranking") return VariableType::RANKING;
    if (t == "open_end" || t == "openend" || t == "open") return VariableType::OPEN_END;
    throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Unknown Variable Type",
                        "Variable_Type '" + text + "' is not recognised",
                        "The question cannot be routed to a processor.",
                        "Use one of Single_Response, Multi_Mention, Rating, Likert, NPS, "
                        "Numeric, Ranking, Open_End.");
}

// ---------------------------------------------------------------------------
// OptionDef — one answer option of a question (Options sheet row)
// ---------------------------------------------------------------------------
struct OptionDef {
    std::string option_text;                 // value as stored in the data
    std::string display_text;                // label shown in output (empty = option_text)
    std::optional<double> display_order;
    bool show_in_output = true;
    bool exclude_from_index = false;
    std::optional<double> index_weight;      // Likert index weight
    std::optional<double> option_value;      // Rating numeric value
    std::string box_category;                // empty = no category
    std::optional<double> min;               // Numeric bin lower bound
    std::optional<double> max;               // Numeric bin upper bound

    const std::string& label() const {
        return display_text.empty() ? option_text : display_text;
    }
};

// ---------------------------------------------------------------------------
// QuestionDef — one question (Questions sheet row)
// ---------------------------------------------------------------------------
struct QuestionDef {
    std::string code;
    std::string text;
    VariableType type = VariableType::SINGLE_RESPONSE;
    std::optional<int> columns;              // Multi_Mention / Ranking column count
    std::string ranking_format;              // "Position" or "Item"
    std::optional<int> ranking_positions;
    std::string ranking_direction;           // "BestToWorst" (default) or "WorstToBest"
    std::optional<double> min_value;         // Numeric validity range
    std::optional<double> max_value;
    std::string base_filter;                 // optional filter expression
    bool selected = true;

    // Physical data columns for multi-column questions: <code>_1 .. <code>_k
    std::vector<std::string> mention_columns() const {
        std::vector<std::string> cols;
        int k = columns.value_or(0);
        for (int i = 1; i <= k; ++i) cols.push_back(code + "_" + std::to_string(i));
        return cols;
    }
};

// ---------------------------------------------------------------------------
// SurveyStructure — questions in declared order plus options by question
// ---------------------------------------------------------------------------
class SurveyStructure {
public:
    void add_question(QuestionDef q) {
        index_[q.code] = questions_.size();
        questions_.push_back(std::move(q));
    }

    void add_option(const std::string& question_code, OptionDef opt) {
        options_[question_code].push_back(std::move(opt));
    }

    const std::vector<QuestionDef>& questions() const { return questions_; }

    bool has_question(const std::string& code) const { return index_.count(code) > 0; }

    const QuestionDef* find_question(const std::string& code) const {
        auto it = index_.find(code);
        if (it == index_.end()) return nullptr;
        return &questions_[it->second];
    }

    const QuestionDef& question(const std::string& code) const {
        const QuestionDef* q = find_question(code);
        if (!q) {
            throw CrosstabError(ErrorCode::CFG_QUESTION_NOT_FOUND, "Question Not Found",
                                "Question '" + code + "' is not defined in the survey structure",
                                "Tables referencing it cannot be produced.",
                                "Add the question to the Questions sheet or fix the code.");
        }
        return *q;
    }

    // All options of a question in declared order (empty if none).
    const std::vector<OptionDef>& options(const std::string& code) const {
        static const std::vector<OptionDef> empty;
        auto it = options_.find(code);
        return it == options_.end() ? empty : it->second;
    }

    // Options shown in output, stably sorted by DisplayOrder (missing last).
    std::vector<OptionDef> display_options(const std::string& code) const {
        std::vector<OptionDef> shown;
        for (const auto& o : options(code)) {
            if (o.show_in_output) shown.push_back(o);
        }
        sort_by_display_order(shown);
        return shown;
    }

    // Distinct non-empty box categories in first-appearance order.
    std::vector<std::string> box_categories(const std::string& code) const {
        std::vector<std::string> cats;
        for (const auto& o : options(code)) {
            if (o.box_category.empty()) continue;
            if (std::find(cats.begin(), cats.end(), o.box_category) == cats.end()) {
                cats.push_back(o.box_category);
            }
        }
        return cats;
    }

    static void sort_by_display_order(std::vector<OptionDef>& opts) {
        std::stable_sort(opts.begin(), opts.end(), [](const OptionDef& a, const OptionDef& b) {
            if (a.display_order.has_value() != b.display_order.has_value()) {
                return a.display_order.has_value();
            }
            if (!a.display_order.has_value()) return false;
            return *a.display_order < *b.display_order;
        });
    }

private:
    std::vector<QuestionDef> questions_;
    std::map<std::string, size_t> index_;
    std::map<std::string, std::vector<OptionDef>> options_;
};
