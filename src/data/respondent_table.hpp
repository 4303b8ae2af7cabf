#pragma once

#include "diagnostics.hpp"
#include "text_utils.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Column — one named, typed column of survey data
// Missing cells are std::nullopt in either storage.
// ---------------------------------------------------------------------------
enum class ColumnType { NUMERIC, TEXT };

struct Column {
    std::string name;
    ColumnType type = ColumnType::TEXT;
    std::vector<std::optional<double>> numbers;      // used when NUMERIC
    std::vector<std::optional<std::string>> texts;   // used when TEXT

    static Column numeric(std::string name, std::vector<std::optional<double>> values) {
        Column c;
        c.name = std::move(name);
        c.type = ColumnType::NUMERIC;
        c.numbers = std::move(values);
        return c;
    }

    static Column text(std::string name, std::vector<std::optional<std::string>> values) {
        Column c;
        c.name = std::move(name);
        c.type = ColumnType::TEXT;
        c.texts = std::move(values);
        return c;
    }

    size_t size() const {
        return type == ColumnType::NUMERIC ? numbers.size() : texts.size();
    }

    bool is_missing(size_t row) const {
        if (type == ColumnType::NUMERIC) return !numbers[row].has_value();
        return !texts[row].has_value();
    }

    // Text view of a cell; numbers use text_utils::format_number.
    std::optional<std::string> text_at(size_t row) const {
        if (type == ColumnType::TEXT) return texts[row];
        if (!numbers[row].has_value()) return std::nullopt;
        return text_utils::format_number(*numbers[row]);
    }

    // Numeric view of a cell; text is parsed, unparseable text is missing.
    std::optional<double> number_at(size_t row) const {
        if (type == ColumnType::NUMERIC) return numbers[row];
        if (!texts[row].has_value()) return std::nullopt;
        return text_utils::parse_number(*texts[row]);
    }

    // Option matching: numeric cells compare numerically against a numeric
    // option, otherwise trimmed case-sensitive text equality.
    bool matches(size_t row, const std::string& option_text) const {
        if (type == ColumnType::NUMERIC) {
            if (!numbers[row].has_value()) return false;
            auto target = text_utils::parse_number(option_text);
            if (target.has_value()) return *numbers[row] == *target;
            return text_utils::trim(text_utils::format_number(*numbers[row])) ==
                   text_utils::trim(option_text);
        }
        return text_utils::safe_equal(texts[row], option_text);
    }
};

// ---------------------------------------------------------------------------
// RespondentTable — survey data, one row per respondent
// Row count is fixed at construction; every column must match it.
// ---------------------------------------------------------------------------
class RespondentTable {
public:
    explicit RespondentTable(size_t row_count = 0) : row_count_(row_count) {}

    size_t row_count() const { return row_count_; }
    size_t column_count() const { return columns_.size(); }

    void add_column(Column col) {
        if (col.size() != row_count_) {
            throw std::invalid_argument("Column '" + col.name + "' has " +
                                        std::to_string(col.size()) + " cells, table has " +
                                        std::to_string(row_count_) + " rows");
        }
        if (index_.count(col.name)) {
            throw std::invalid_argument("Duplicate column name: " + col.name);
        }
        index_[col.name] = columns_.size();
        columns_.push_back(std::move(col));
    }

    bool has_column(const std::string& name) const { return index_.count(name) > 0; }

    const Column* find_column(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) return nullptr;
        return &columns_[it->second];
    }

    const Column& column(const std::string& name) const {
        const Column* col = find_column(name);
        if (!col) {
            throw CrosstabError(ErrorCode::DATA_COLUMN_NOT_FOUND,
                                "Column Not Found",
                                "Column '" + name + "' is not present in the data",
                                "Values for this column cannot be tabulated.",
                                "Check the column name against the data file header.");
        }
        return *col;
    }

    const std::vector<Column>& columns() const { return columns_; }

    std::vector<std::string> column_names() const {
        std::vector<std::string> names;
        names.reserve(columns_.size());
        for (const auto& c : columns_) names.push_back(c.name);
        return names;
    }

    // All row indices [0, row_count).
    std::vector<size_t> all_rows() const {
        std::vector<size_t> rows(row_count_);
        for (size_t i = 0; i < row_count_; ++i) rows[i] = i;
        return rows;
    }

private:
    size_t row_count_ = 0;
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
};
