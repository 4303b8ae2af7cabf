#pragma once

#include "data/respondent_table.hpp"
#include "diagnostics.hpp"
#include "io/arrow_status.hpp"

#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tab_io {

namespace detail {

template <typename ArrayT>
void append_numbers(const arrow::Array& chunk, std::vector<std::optional<double>>& out) {
    const auto& arr = static_cast<const ArrayT&>(chunk);
    for (int64_t i = 0; i < arr.length(); ++i) {
        if (arr.IsNull(i)) {
            out.emplace_back(std::nullopt);
        } else {
            out.emplace_back(static_cast<double>(arr.Value(i)));
        }
    }
}

inline bool is_numeric(arrow::Type::type id) {
    switch (id) {
        case arrow::Type::INT8:
        case arrow::Type::INT16:
        case arrow::Type::INT32:
        case arrow::Type::INT64:
        case arrow::Type::UINT8:
        case arrow::Type::UINT16:
        case arrow::Type::UINT32:
        case arrow::Type::UINT64:
        case arrow::Type::FLOAT:
        case arrow::Type::DOUBLE:
            return true;
        default:
            return false;
    }
}

inline void append_numeric_chunk(const arrow::Array& chunk,
                                 std::vector<std::optional<double>>& out) {
    switch (chunk.type_id()) {
        case arrow::Type::INT8:   append_numbers<arrow::Int8Array>(chunk, out); break;
        case arrow::Type::INT16:  append_numbers<arrow::Int16Array>(chunk, out); break;
        case arrow::Type::INT32:  append_numbers<arrow::Int32Array>(chunk, out); break;
        case arrow::Type::INT64:  append_numbers<arrow::Int64Array>(chunk, out); break;
        case arrow::Type::UINT8:  append_numbers<arrow::UInt8Array>(chunk, out); break;
        case arrow::Type::UINT16: append_numbers<arrow::UInt16Array>(chunk, out); break;
        case arrow::Type::UINT32: append_numbers<arrow::UInt32Array>(chunk, out); break;
        case arrow::Type::UINT64: append_numbers<arrow::UInt64Array>(chunk, out); break;
        case arrow::Type::FLOAT:  append_numbers<arrow::FloatArray>(chunk, out); break;
        case arrow::Type::DOUBLE: append_numbers<arrow::DoubleArray>(chunk, out); break;
        default:
            throw std::invalid_argument("append_numeric_chunk: not a numeric array");
    }
}

// Text view of any non-numeric chunk; empty strings are missing.
inline void append_text_chunk(const arrow::Array& chunk, const std::string& column,
                              std::vector<std::optional<std::string>>& out) {
    for (int64_t i = 0; i < chunk.length(); ++i) {
        if (chunk.IsNull(i)) {
            out.emplace_back(std::nullopt);
            continue;
        }
        std::string text;
        if (chunk.type_id() == arrow::Type::STRING) {
            text = static_cast<const arrow::StringArray&>(chunk).GetString(i);
        } else if (chunk.type_id() == arrow::Type::LARGE_STRING) {
            text = static_cast<const arrow::LargeStringArray&>(chunk).GetString(i);
        } else if (chunk.type_id() == arrow::Type::BOOL) {
            text = static_cast<const arrow::BooleanArray&>(chunk).Value(i) ? "TRUE" : "FALSE";
        } else {
            auto scalar = value_or_throw(chunk.GetScalar(i), ErrorCode::DATA_LOAD_FAILED,
                                         "column '" + column + "'");
            text = scalar->ToString();
        }
        if (text_utils::trim(text).empty()) {
            out.emplace_back(std::nullopt);
        } else {
            out.emplace_back(std::move(text));
        }
    }
}

inline std::shared_ptr<arrow::Table> read_csv_arrow(const std::string& path,
                                                    const std::vector<std::string>& null_values) {
    auto input = value_or_throw(arrow::io::ReadableFile::Open(path),
                                ErrorCode::DATA_LOAD_FAILED, "open " + path);

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    convert_options.null_values = null_values;
    convert_options.strings_can_be_null = true;

    auto reader = value_or_throw(
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options,
                                      parse_options, convert_options),
        ErrorCode::DATA_LOAD_FAILED, "parse " + path);
    return value_or_throw(reader->Read(), ErrorCode::DATA_LOAD_FAILED, "read " + path);
}

inline std::shared_ptr<arrow::Table> read_parquet_arrow(const std::string& path) {
    auto input = value_or_throw(arrow::io::ReadableFile::Open(path),
                                ErrorCode::DATA_LOAD_FAILED, "open " + path);
    auto reader = value_or_throw(parquet::arrow::OpenFile(input, arrow::default_memory_pool()),
                                 ErrorCode::DATA_LOAD_FAILED, "open parquet " + path);
    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), ErrorCode::DATA_LOAD_FAILED, "read " + path);
    return table;
}

}  // namespace detail

// Integer and floating columns become numeric, everything else text.
inline RespondentTable from_arrow(const arrow::Table& table) {
    RespondentTable out(static_cast<size_t>(table.num_rows()));
    for (int c = 0; c < table.num_columns(); ++c) {
        const std::string name = table.field(c)->name();
        if (out.has_column(name)) {
            throw CrosstabError(ErrorCode::DATA_LOAD_FAILED, "Duplicate Column",
                                "Column '" + name + "' appears more than once",
                                "Values could be read from the wrong column.",
                                "Give every column in the file a unique header.");
        }
        const auto& chunked = table.column(c);
        if (detail::is_numeric(table.field(c)->type()->id())) {
            std::vector<std::optional<double>> values;
            values.reserve(static_cast<size_t>(table.num_rows()));
            for (const auto& chunk : chunked->chunks()) detail::append_numeric_chunk(*chunk, values);
            out.add_column(Column::numeric(name, std::move(values)));
        } else {
            std::vector<std::optional<std::string>> values;
            values.reserve(static_cast<size_t>(table.num_rows()));
            for (const auto& chunk : chunked->chunks()) {
                detail::append_text_chunk(*chunk, name, values);
            }
            out.add_column(Column::text(name, std::move(values)));
        }
    }
    return out;
}

// Load a .csv or .parquet file. For CSV, `null_values` are the cell texts
// read as missing (empty cells always are).
inline RespondentTable read_table(const std::string& path,
                                  const std::vector<std::string>& null_values = {"", "NA"}) {
    if (!std::filesystem::exists(path)) {
        throw CrosstabError(ErrorCode::DATA_LOAD_FAILED, "File Not Found",
                            "Input file does not exist: " + path, "",
                            "Check the path passed on the command line.");
    }
    std::string ext = text_utils::to_lower(std::filesystem::path(path).extension().string());
    std::shared_ptr<arrow::Table> table;
    if (ext == ".parquet") {
        table = detail::read_parquet_arrow(path);
    } else if (ext == ".csv") {
        table = detail::read_csv_arrow(path, null_values);
    } else {
        throw CrosstabError(ErrorCode::DATA_LOAD_FAILED, "Unsupported File Type",
                            "Cannot read '" + path + "'", "",
                            "Use a .csv or .parquet file.");
    }
    return from_arrow(*table);
}

}  // namespace tab_io
