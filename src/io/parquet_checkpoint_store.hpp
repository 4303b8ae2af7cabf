#pragma once

#include "cells/question_table.hpp"
#include "data/segment_key.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "io/arrow_status.hpp"
#include "io/table_reader.hpp"
#include "runner/checkpoint_store.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// ParquetCheckpointStore — checkpoint as two Parquet files
//
//   <prefix>.tables.parquet    long format, one record per table cell; base
//                              sizes are records with row_index -1, -2, -3
//   <prefix>.progress.parquet  processed codes in order, with skip reasons
//   <prefix>.issues.parquet    omitted significance tests ("test") and
//                              untabulated ranking items ("item")
//
// load() returns nullopt when the progress file is absent.
// ---------------------------------------------------------------------------
class ParquetCheckpointStore : public CheckpointStore {
public:
    explicit ParquetCheckpointStore(std::string prefix)
        : tables_path_(prefix + ".tables.parquet"),
          progress_path_(prefix + ".progress.parquet"),
          issues_path_(prefix + ".issues.parquet") {}

    const std::string& tables_path() const { return tables_path_; }
    const std::string& progress_path() const { return progress_path_; }
    const std::string& issues_path() const { return issues_path_; }

    std::optional<Checkpoint> load() override {
        if (!std::filesystem::exists(progress_path_)) return std::nullopt;
        Checkpoint cp;
        read_progress(tab_io::from_arrow(*tab_io::detail::read_parquet_arrow(progress_path_)), cp);
        if (std::filesystem::exists(tables_path_)) {
            read_tables(tab_io::from_arrow(*tab_io::detail::read_parquet_arrow(tables_path_)), cp);
        }
        if (std::filesystem::exists(issues_path_)) {
            read_issues(tab_io::from_arrow(*tab_io::detail::read_parquet_arrow(issues_path_)), cp);
        }
        return cp;
    }

    void save(const Checkpoint& checkpoint) override {
        write_tables(checkpoint.tables);
        write_issues(checkpoint);
        write_progress(checkpoint);
    }

    void clear() override {
        std::error_code ec;
        std::filesystem::remove(tables_path_, ec);
        std::filesystem::remove(progress_path_, ec);
        std::filesystem::remove(issues_path_, ec);
    }

private:
    static constexpr int64_t UNWEIGHTED_BASE_ROW = -1;
    static constexpr int64_t WEIGHTED_BASE_ROW = -2;
    static constexpr int64_t EFFECTIVE_BASE_ROW = -3;

    // Column builders of the long-format cell table.
    struct CellColumns {
        arrow::StringBuilder code, text, type, filter, label, kind, key, cell_kind, cell_text;
        arrow::Int64Builder row_index, column_index;
        arrow::DoubleBuilder number;

        void append(const QuestionTable& t, int64_t row, const std::string& row_label,
                    const std::string& row_kind, size_t col, const Cell& cell) {
            const std::string ctx = "checkpoint " + t.question_code;
            auto ok = [&](const arrow::Status& s) {
                tab_io::check(s, ErrorCode::IO_WRITE_FAILED, ctx);
            };
            ok(code.Append(t.question_code));
            ok(text.Append(t.question_text));
            ok(type.Append(variable_type_str(t.type)));
            ok(filter.Append(t.base_filter));
            ok(row_index.Append(row));
            ok(label.Append(row_label));
            ok(kind.Append(row_kind));
            ok(column_index.Append(static_cast<int64_t>(col)));
            ok(key.Append(col < t.keys.size() ? t.keys[col].str() : ""));
            if (const auto* d = std::get_if<double>(&cell)) {
                ok(cell_kind.Append("number"));
                ok(number.Append(*d));
                ok(cell_text.AppendNull());
            } else if (const auto* s = std::get_if<std::string>(&cell)) {
                ok(cell_kind.Append("text"));
                ok(number.AppendNull());
                ok(cell_text.Append(*s));
            } else {
                ok(cell_kind.Append("blank"));
                ok(number.AppendNull());
                ok(cell_text.AppendNull());
            }
        }
    };

    static std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b, const std::string& field) {
        std::shared_ptr<arrow::Array> arr;
        tab_io::check(b.Finish(&arr), ErrorCode::IO_WRITE_FAILED, "checkpoint " + field);
        return arr;
    }

    static void write_parquet(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
        auto outfile = tab_io::value_or_throw(arrow::io::FileOutputStream::Open(path),
                                              ErrorCode::IO_WRITE_FAILED, "open " + path);
        auto props = parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->build();
        tab_io::check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                                 /*chunk_size=*/1 << 16, props),
                      ErrorCode::IO_WRITE_FAILED, "write " + path);
        tab_io::check(outfile->Close(), ErrorCode::IO_WRITE_FAILED, "close " + path);
    }

    void write_tables(const std::vector<QuestionTable>& tables) const {
        CellColumns cols;
        for (const auto& t : tables) {
            for (size_t c = 0; c < t.bases.size(); ++c) {
                cols.append(t, UNWEIGHTED_BASE_ROW, "", "Base", c, t.bases[c].unweighted);
                cols.append(t, WEIGHTED_BASE_ROW, "", "Base", c, t.bases[c].weighted);
                cols.append(t, EFFECTIVE_BASE_ROW, "", "Base", c, t.bases[c].effective);
            }
            for (size_t r = 0; r < t.rows.size(); ++r) {
                const auto& row = t.rows[r];
                for (size_t c = 0; c < row.cells.size(); ++c) {
                    cols.append(t, static_cast<int64_t>(r), row.label, row_kind_str(row.kind), c,
                                row.cells[c]);
                }
            }
        }

        arrow::FieldVector fields = {
            arrow::field("question_code", arrow::utf8()),
            arrow::field("question_text", arrow::utf8()),
            arrow::field("variable_type", arrow::utf8()),
            arrow::field("base_filter", arrow::utf8()),
            arrow::field("row_index", arrow::int64()),
            arrow::field("row_label", arrow::utf8()),
            arrow::field("row_kind", arrow::utf8()),
            arrow::field("column_index", arrow::int64()),
            arrow::field("segment_key", arrow::utf8()),
            arrow::field("cell_kind", arrow::utf8()),
            arrow::field("number", arrow::float64()),
            arrow::field("text", arrow::utf8()),
        };
        std::vector<std::shared_ptr<arrow::Array>> arrays = {
            finish(cols.code, "question_code"),   finish(cols.text, "question_text"),
            finish(cols.type, "variable_type"),   finish(cols.filter, "base_filter"),
            finish(cols.row_index, "row_index"),  finish(cols.label, "row_label"),
            finish(cols.kind, "row_kind"),        finish(cols.column_index, "column_index"),
            finish(cols.key, "segment_key"),      finish(cols.cell_kind, "cell_kind"),
            finish(cols.number, "number"),        finish(cols.cell_text, "text"),
        };
        write_parquet(arrow::Table::Make(arrow::schema(fields), arrays), tables_path_);
    }

    void write_progress(const Checkpoint& checkpoint) const {
        arrow::StringBuilder code, reason;
        arrow::BooleanBuilder skipped;
        auto ok = [](const arrow::Status& s) {
            tab_io::check(s, ErrorCode::IO_WRITE_FAILED, "checkpoint progress");
        };
        for (const auto& c : checkpoint.processed) {
            const SkippedQuestion* skip = nullptr;
            for (const auto& s : checkpoint.skipped) {
                if (s.code == c) skip = &s;
            }
            ok(code.Append(c));
            ok(skipped.Append(skip != nullptr));
            ok(reason.Append(skip ? skip->reason : ""));
        }
        arrow::FieldVector fields = {
            arrow::field("question_code", arrow::utf8()),
            arrow::field("skipped", arrow::boolean()),
            arrow::field("skip_reason", arrow::utf8()),
        };
        std::vector<std::shared_ptr<arrow::Array>> arrays = {
            finish(code, "question_code"), finish(skipped, "skipped"),
            finish(reason, "skip_reason")};
        write_parquet(arrow::Table::Make(arrow::schema(fields), arrays), progress_path_);
    }

    void write_issues(const Checkpoint& checkpoint) const {
        arrow::StringBuilder kind, code, scope, reason;
        auto ok = [](const arrow::Status& s) {
            tab_io::check(s, ErrorCode::IO_WRITE_FAILED, "checkpoint issues");
        };
        for (const auto& t : checkpoint.skipped_tests) {
            ok(kind.Append("test"));
            ok(code.Append(t.question));
            ok(scope.Append(t.scope));
            ok(reason.Append(t.reason));
        }
        for (const auto& f : checkpoint.failed_items) {
            ok(kind.Append("item"));
            ok(code.Append(f.code));
            ok(scope.Append(f.item));
            ok(reason.Append(""));
        }
        arrow::FieldVector fields = {
            arrow::field("kind", arrow::utf8()),
            arrow::field("question_code", arrow::utf8()),
            arrow::field("scope", arrow::utf8()),
            arrow::field("reason", arrow::utf8()),
        };
        std::vector<std::shared_ptr<arrow::Array>> arrays = {
            finish(kind, "kind"), finish(code, "question_code"), finish(scope, "scope"),
            finish(reason, "reason")};
        write_parquet(arrow::Table::Make(arrow::schema(fields), arrays), issues_path_);
    }

    static CrosstabError corrupt(const std::string& path, const std::string& problem) {
        return CrosstabError(ErrorCode::DATA_LOAD_FAILED, "Corrupt Checkpoint",
                             path + ": " + problem, "The checkpoint cannot be resumed.",
                             "Delete the checkpoint files to start fresh.");
    }

    void read_progress(const RespondentTable& t, Checkpoint& cp) const {
        for (const char* name : {"question_code", "skipped", "skip_reason"}) {
            if (!t.has_column(name)) throw corrupt(progress_path_, std::string("no column ") + name);
        }
        const Column& code = t.column("question_code");
        const Column& skipped = t.column("skipped");
        const Column& reason = t.column("skip_reason");
        for (size_t r = 0; r < t.row_count(); ++r) {
            auto c = code.text_at(r);
            if (!c.has_value()) throw corrupt(progress_path_, "blank question code");
            cp.processed.push_back(*c);
            if (skipped.text_at(r).value_or("FALSE") == "TRUE") {
                cp.skipped.push_back({*c, reason.text_at(r).value_or("")});
            }
        }
    }

    void read_issues(const RespondentTable& t, Checkpoint& cp) const {
        for (const char* name : {"kind", "question_code", "scope", "reason"}) {
            if (!t.has_column(name)) throw corrupt(issues_path_, std::string("no column ") + name);
        }
        const Column& kind = t.column("kind");
        const Column& code = t.column("question_code");
        const Column& scope = t.column("scope");
        const Column& reason = t.column("reason");
        for (size_t r = 0; r < t.row_count(); ++r) {
            std::string k = kind.text_at(r).value_or("");
            std::string c = code.text_at(r).value_or("");
            if (k == "test") {
                cp.skipped_tests.push_back(
                    {c, scope.text_at(r).value_or(""), reason.text_at(r).value_or("")});
            } else if (k == "item") {
                cp.failed_items.push_back({c, scope.text_at(r).value_or("")});
            } else {
                throw corrupt(issues_path_, "unknown record kind '" + k + "'");
            }
        }
    }

    void read_tables(const RespondentTable& t, Checkpoint& cp) const {
        for (const char* name : {"question_code", "question_text", "variable_type", "base_filter",
                                 "row_index", "row_label", "row_kind", "column_index",
                                 "segment_key", "cell_kind", "number", "text"}) {
            if (!t.has_column(name)) throw corrupt(tables_path_, std::string("no column ") + name);
        }
        const Column& code = t.column("question_code");
        const Column& qtext = t.column("question_text");
        const Column& type = t.column("variable_type");
        const Column& filter = t.column("base_filter");
        const Column& row_index = t.column("row_index");
        const Column& label = t.column("row_label");
        const Column& kind = t.column("row_kind");
        const Column& column_index = t.column("column_index");
        const Column& key = t.column("segment_key");
        const Column& cell_kind = t.column("cell_kind");
        const Column& number = t.column("number");
        const Column& text = t.column("text");

        QuestionTable* current = nullptr;
        for (size_t r = 0; r < t.row_count(); ++r) {
            std::string c = code.text_at(r).value_or("");
            if (!current || current->question_code != c) {
                cp.tables.emplace_back();
                current = &cp.tables.back();
                current->question_code = c;
                current->question_text = qtext.text_at(r).value_or("");
                current->type = parse_variable_type(type.text_at(r).value_or(""));
                current->base_filter = filter.text_at(r).value_or("");
            }
            auto ri = row_index.number_at(r);
            auto ci = column_index.number_at(r);
            if (!ri.has_value() || !ci.has_value() || *ci < 0) {
                throw corrupt(tables_path_, "missing row or column index at record " +
                                                std::to_string(r));
            }
            size_t col = static_cast<size_t>(*ci);
            std::string ck = cell_kind.text_at(r).value_or("blank");
            Cell cell;
            if (ck == "number") {
                cell = number.number_at(r).value_or(0.0);
            } else if (ck == "text") {
                cell = text.text_at(r).value_or("");
            }

            int64_t row = static_cast<int64_t>(*ri);
            if (row < 0) {
                if (current->bases.size() <= col) current->bases.resize(col + 1);
                if (current->keys.size() <= col) {
                    current->keys.resize(col + 1, SegmentKey::total());
                }
                current->keys[col] = SegmentKey::parse(key.text_at(r).value_or(""));
                double v = std::holds_alternative<double>(cell) ? std::get<double>(cell) : 0.0;
                if (row == UNWEIGHTED_BASE_ROW) current->bases[col].unweighted = v;
                else if (row == WEIGHTED_BASE_ROW) current->bases[col].weighted = v;
                else if (row == EFFECTIVE_BASE_ROW) current->bases[col].effective = v;
                continue;
            }

            size_t ridx = static_cast<size_t>(row);
            if (current->rows.size() <= ridx) current->rows.resize(ridx + 1);
            QuestionRow& qr = current->rows[ridx];
            qr.label = label.text_at(r).value_or("");
            qr.kind = parse_row_kind(kind.text_at(r).value_or(""));
            if (qr.cells.size() <= col) qr.cells.resize(col + 1);
            qr.cells[col] = std::move(cell);
        }
    }

    std::string tables_path_;
    std::string progress_path_;
    std::string issues_path_;
};
