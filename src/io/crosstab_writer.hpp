#pragma once

#include "config/crosstab_config.hpp"
#include "diagnostics.hpp"
#include "io/arrow_status.hpp"
#include "io/output_format.hpp"
#include "runner/crosstab_runner.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace tab_io {

constexpr const char* QUESTION_CODE_FIELD = "question_code";
constexpr const char* QUESTION_TEXT_FIELD = "question_text";
constexpr const char* ROW_LABEL_FIELD = "row_label";
constexpr const char* ROW_TYPE_FIELD = "row_type";

// Column names of the wide layout: four row fields, then one per banner key.
inline std::vector<std::string> output_columns(const BannerStructure& structure) {
    std::vector<std::string> names = {QUESTION_CODE_FIELD, QUESTION_TEXT_FIELD, ROW_LABEL_FIELD,
                                      ROW_TYPE_FIELD};
    for (const auto& key : structure.keys()) names.push_back(key.str());
    return names;
}

namespace detail {

inline std::shared_ptr<arrow::Array> string_array(const std::vector<std::string>& values,
                                                  const std::string& field) {
    arrow::StringBuilder b;
    for (const auto& v : values) check(b.Append(v), ErrorCode::IO_WRITE_FAILED, field);
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), ErrorCode::IO_WRITE_FAILED, field);
    return arr;
}

inline std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n\r") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

}  // namespace detail

// Write every string column as utf8 into one ZSTD-compressed Parquet file.
inline void write_string_table(const std::string& path, const std::vector<std::string>& names,
                               const std::vector<std::vector<std::string>>& columns) {
    arrow::FieldVector fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    int64_t num_rows = columns.empty() ? 0 : static_cast<int64_t>(columns.front().size());
    for (size_t c = 0; c < names.size(); ++c) {
        fields.push_back(arrow::field(names[c], arrow::utf8()));
        arrays.push_back(detail::string_array(columns[c], names[c]));
    }
    auto table = arrow::Table::Make(arrow::schema(fields), arrays, num_rows);

    auto outfile = value_or_throw(arrow::io::FileOutputStream::Open(path),
                                  ErrorCode::IO_WRITE_FAILED, "open " + path);
    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();
    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     /*chunk_size=*/std::max<int64_t>(num_rows, 1), props),
          ErrorCode::IO_WRITE_FAILED, "write " + path);
    check(outfile->Close(), ErrorCode::IO_WRITE_FAILED, "close " + path);
}

inline void write_crosstabs_parquet(const RunReport& report, const CrosstabConfig& cfg,
                                    const std::string& path) {
    std::vector<std::string> names = output_columns(report.structure);
    std::vector<std::vector<std::string>> columns(names.size());
    for (const auto& row : flatten(report, cfg)) {
        columns[0].push_back(row.question_code);
        columns[1].push_back(row.question_text);
        columns[2].push_back(row.label);
        columns[3].push_back(row.row_type);
        for (size_t c = 0; c + 4 < names.size(); ++c) {
            columns[c + 4].push_back(c < row.cells.size() ? row.cells[c] : "");
        }
    }
    write_string_table(path, names, columns);
}

// Parquet layout written as CSV. A label repeated on consecutive rows of one question
// (Frequency, Column %, Sig.) is printed once.
inline void write_crosstabs_csv(const RunReport& report, const CrosstabConfig& cfg,
                                const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw CrosstabError(ErrorCode::IO_WRITE_FAILED, "Write Failed",
                            "Cannot open output file: " + path);
    }
    std::vector<std::string> names = output_columns(report.structure);
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out << ",";
        out << detail::csv_field(names[i]);
    }
    out << "\n";

    std::string prev_code, prev_label;
    for (const auto& row : flatten(report, cfg)) {
        bool repeat = row.question_code == prev_code && row.label == prev_label;
        out << detail::csv_field(row.question_code) << "," << detail::csv_field(row.question_text)
            << "," << (repeat ? "" : detail::csv_field(row.label)) << ","
            << detail::csv_field(row.row_type);
        for (size_t c = 0; c + 4 < names.size(); ++c) {
            out << "," << (c < row.cells.size() ? detail::csv_field(row.cells[c]) : "");
        }
        out << "\n";
        prev_code = row.question_code;
        prev_label = row.label;
    }
    if (!out.good()) {
        throw CrosstabError(ErrorCode::IO_WRITE_FAILED, "Write Failed",
                            "Error while writing " + path);
    }
}

}  // namespace tab_io
