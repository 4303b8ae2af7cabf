#pragma once

#include "banner/banner_structure.hpp"
#include "data/respondent_table.hpp"
#include "diagnostics.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RowIndexMap — materialized segmentation for one question
// One sorted, duplicate-free index set per banner column, aligned with
// BannerStructure::columns(). Indices refer to rows of the full table.
// ---------------------------------------------------------------------------
class RowIndexMap {
public:
    RowIndexMap() = default;
    explicit RowIndexMap(std::vector<std::vector<size_t>> sets) : sets_(std::move(sets)) {}

    size_t size() const { return sets_.size(); }

    std::span<const size_t> rows(size_t column) const {
        return {sets_[column].data(), sets_[column].size()};
    }

    const std::vector<size_t>& at(size_t column) const { return sets_[column]; }

private:
    std::vector<std::vector<size_t>> sets_;
};

namespace banner {

// Membership of one row in a non-Total banner column.
inline bool row_in_column(const BannerColumn& col,
                          const std::vector<const Column*>& data_cols, size_t row) {
    for (const Column* dc : data_cols) {
        for (const auto& value : col.match_values) {
            if (dc->matches(row, value)) return true;
        }
    }
    return false;
}

// Segment the base rows (a filtered subset, or all rows) of `table`.
// Single-column sources missing from the data are configuration errors;
// multi-mention sources with no existing mention column yield empty sets.
inline RowIndexMap build_row_index_map(const RespondentTable& table,
                                       std::span<const size_t> base_rows,
                                       const BannerStructure& structure) {
    std::vector<std::vector<size_t>> sets;
    sets.reserve(structure.size());

    for (const auto& col : structure.columns()) {
        if (col.key.is_total()) {
            sets.emplace_back(base_rows.begin(), base_rows.end());
            continue;
        }

        std::vector<const Column*> data_cols;
        for (const auto& name : col.source_columns) {
            const Column* dc = table.find_column(name);
            if (dc) {
                data_cols.push_back(dc);
            } else if (!col.multi_mention) {
                throw CrosstabError(ErrorCode::CFG_BANNER_COLUMN_NOT_FOUND,
                                    "Banner Column Not Found",
                                    "Banner column '" + name + "' (segment " + col.key.str() +
                                        ") is not in the data",
                                    "Segment membership would silently be empty.",
                                    "Check the banner question code against the data header.");
            }
        }

        std::vector<size_t> rows;
        if (!data_cols.empty()) {
            for (size_t r : base_rows) {
                if (row_in_column(col, data_cols, r)) rows.push_back(r);
            }
        }
        sets.push_back(std::move(rows));
    }
    return RowIndexMap(std::move(sets));
}

}  // namespace banner
