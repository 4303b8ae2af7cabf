#pragma once

#include "data/segment_key.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BannerRequest — one banner question as declared in the Banner sheet
// ---------------------------------------------------------------------------
struct BannerRequest {
    std::string question_code;
    bool use_box_category = false;
    std::string banner_label;
    std::optional<double> display_order;
};

// ---------------------------------------------------------------------------
// BannerColumn — one population segment and its membership predicate
// A row belongs if any of `source_columns` holds any of `match_values`.
// ---------------------------------------------------------------------------
struct BannerColumn {
    SegmentKey key = SegmentKey::total();
    std::string label;
    std::string letter;                          // "-" for Total
    std::string group_code;                      // empty for Total
    std::vector<std::string> source_columns;     // empty for Total
    std::vector<std::string> match_values;
    bool multi_mention = false;
};

// ---------------------------------------------------------------------------
// BannerGroup — segments of one banner question; tests stay inside a group
// ---------------------------------------------------------------------------
struct BannerGroup {
    std::string code;
    std::string label;
    std::vector<size_t> columns;                 // indices into BannerStructure::columns
};

// ---------------------------------------------------------------------------
// BannerStructure — Total column first, then each group's columns in order
// ---------------------------------------------------------------------------
class BannerStructure {
public:
    const std::vector<BannerColumn>& columns() const { return columns_; }
    const std::vector<BannerGroup>& groups() const { return groups_; }
    size_t size() const { return columns_.size(); }

    std::vector<SegmentKey> keys() const {
        std::vector<SegmentKey> out;
        out.reserve(columns_.size());
        for (const auto& c : columns_) out.push_back(c.key);
        return out;
    }

    std::optional<size_t> index_of(const SegmentKey& key) const {
        for (size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].key == key) return i;
        }
        return std::nullopt;
    }

    static constexpr size_t TOTAL_INDEX = 0;

    void add_total() {
        BannerColumn total;
        total.key = SegmentKey::total();
        total.label = SegmentKey::TOTAL_LABEL;
        total.letter = "-";
        columns_.push_back(total);
    }

    void add_group(BannerGroup group, std::vector<BannerColumn> cols) {
        std::set<std::string> seen;
        for (const auto& c : columns_) seen.insert(c.key.str());
        for (auto& c : cols) {
            if (!seen.insert(c.key.str()).second) {
                throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Duplicate Banner Key",
                                    "Banner key '" + c.key.str() + "' appears twice",
                                    "Two segments would share output columns.",
                                    "Give banner options distinct display texts.");
            }
            group.columns.push_back(columns_.size());
            columns_.push_back(std::move(c));
        }
        groups_.push_back(std::move(group));
    }

private:
    std::vector<BannerColumn> columns_;
    std::vector<BannerGroup> groups_;
};

namespace banner {

// Excel-style column letters: 0 -> A, 25 -> Z, 26 -> AA, ...
inline std::string column_letter(size_t index) {
    std::string letters;
    size_t n = index + 1;
    while (n > 0) {
        size_t rem = (n - 1) % 26;
        letters.insert(letters.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return letters;
}

namespace detail {

inline std::vector<std::string> source_columns_for(const QuestionDef& q) {
    if (q.type == VariableType::MULTI_MENTION) return q.mention_columns();
    return {q.code};
}

inline std::vector<BannerColumn> standard_columns(const SurveyStructure& survey,
                                                  const QuestionDef& q) {
    std::vector<BannerColumn> cols;
    for (const auto& opt : survey.display_options(q.code)) {
        BannerColumn c;
        c.key = SegmentKey::standard(q.code, opt.label());
        c.label = opt.label();
        c.group_code = q.code;
        c.source_columns = source_columns_for(q);
        c.match_values = {opt.option_text};
        c.multi_mention = q.type == VariableType::MULTI_MENTION;
        cols.push_back(std::move(c));
    }
    return cols;
}

inline std::vector<BannerColumn> box_category_columns(const SurveyStructure& survey,
                                                      const QuestionDef& q) {
    // Categories ordered by the smallest DisplayOrder of their options.
    std::vector<OptionDef> ordered = survey.options(q.code);
    SurveyStructure::sort_by_display_order(ordered);

    std::vector<BannerColumn> cols;
    for (const auto& opt : ordered) {
        if (opt.box_category.empty()) continue;
        auto it = std::find_if(cols.begin(), cols.end(), [&](const BannerColumn& c) {
            return c.label == opt.box_category;
        });
        if (it == cols.end()) {
            BannerColumn c;
            c.key = SegmentKey::box_category(q.code, opt.box_category);
            c.label = opt.box_category;
            c.group_code = q.code;
            c.source_columns = source_columns_for(q);
            c.multi_mention = q.type == VariableType::MULTI_MENTION;
            cols.push_back(std::move(c));
            it = cols.end() - 1;
        }
        it->match_values.push_back(opt.option_text);
    }
    return cols;
}

}  // namespace detail

// Build the banner structure from the declared banner questions.
inline BannerStructure build_structure(const SurveyStructure& survey,
                                       const std::vector<BannerRequest>& requests) {
    std::vector<BannerRequest> ordered = requests;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const BannerRequest& a, const BannerRequest& b) {
                         if (a.display_order.has_value() != b.display_order.has_value()) {
                             return a.display_order.has_value();
                         }
                         if (!a.display_order.has_value()) return false;
                         return *a.display_order < *b.display_order;
                     });

    BannerStructure structure;
    structure.add_total();

    for (const auto& req : ordered) {
        const QuestionDef* q = survey.find_question(req.question_code);
        if (!q) {
            throw CrosstabError(ErrorCode::CFG_BANNER_QUESTION_NOT_FOUND,
                                "Banner Question Not Found",
                                "Banner question '" + req.question_code +
                                    "' is not in the survey structure",
                                "Segments for it cannot be defined.",
                                "Add the question to the Questions sheet or fix the Banner sheet.");
        }

        std::vector<BannerColumn> cols;
        try {
            cols = req.use_box_category ? detail::box_category_columns(survey, *q)
                                        : detail::standard_columns(survey, *q);
        } catch (const std::invalid_argument& e) {
            throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Invalid Banner Segment",
                                "Banner question '" + q->code + "': " + e.what(),
                                "Segment keys must round-trip through their text form.",
                                "Rename the question or option.");
        }
        if (req.use_box_category) {
            if (cols.empty()) {
                throw CrosstabError(ErrorCode::CFG_BANNER_NO_BOXCATEGORY,
                                    "No Box Categories",
                                    "Banner question '" + q->code +
                                        "' uses box categories but none are defined",
                                    "The banner group would have no segments.",
                                    "Fill BoxCategory for its options or turn BannerBoxCategory off.");
            }
        } else {
            if (cols.empty()) {
                throw CrosstabError(ErrorCode::CFG_BANNER_NO_OPTIONS, "No Banner Options",
                                    "Banner question '" + q->code +
                                        "' has no options shown in output",
                                    "The banner group would have no segments.",
                                    "Add options or set ShowInOutput for them.");
            }
        }

        for (size_t i = 0; i < cols.size(); ++i) cols[i].letter = column_letter(i);

        BannerGroup group;
        group.code = q->code;
        if (!req.banner_label.empty()) {
            group.label = req.banner_label;
        } else if (!q->text.empty()) {
            group.label = q->text;
        } else {
            group.label = q->code;
        }
        structure.add_group(std::move(group), std::move(cols));
    }
    return structure;
}

}  // namespace banner
