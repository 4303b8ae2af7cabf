#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RankingMatrix — respondent x item rank positions
// One row per data row (the full table, never a filtered copy); a missing
// cell means the item was not ranked by that respondent.
// ---------------------------------------------------------------------------
class RankingMatrix {
public:
    RankingMatrix() = default;

    RankingMatrix(size_t row_count, std::vector<std::string> items, int num_positions)
        : rows_(row_count),
          items_(std::move(items)),
          num_positions_(num_positions),
          cells_(row_count * items_.size()) {}

    size_t rows() const { return rows_; }
    size_t item_count() const { return items_.size(); }
    int num_positions() const { return num_positions_; }
    const std::vector<std::string>& items() const { return items_; }

    bool empty() const { return rows_ == 0 || items_.empty(); }

    const std::optional<double>& at(size_t row, size_t item) const {
        return cells_[row * items_.size() + item];
    }

    void set(size_t row, size_t item, std::optional<double> rank) {
        cells_[row * items_.size() + item] = rank;
    }

    size_t item_index(const std::string& item) const {
        for (size_t i = 0; i < items_.size(); ++i) {
            if (items_[i] == item) return i;
        }
        throw std::invalid_argument("Unknown ranking item: " + item);
    }

    bool operator==(const RankingMatrix& other) const {
        return rows_ == other.rows_ && items_ == other.items_ &&
               num_positions_ == other.num_positions_ && cells_ == other.cells_;
    }

private:
    size_t rows_ = 0;
    std::vector<std::string> items_;
    int num_positions_ = 0;
    std::vector<std::optional<double>> cells_;   // row-major
};
