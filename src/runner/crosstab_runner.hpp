#pragma once

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "cells/cell_calculator.hpp"
#include "cells/question_table.hpp"
#include "composite/composite.hpp"
#include "config/crosstab_config.hpp"
#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "filter/filter_expression.hpp"
#include "processing/question_context.hpp"
#include "processing/question_dispatcher.hpp"
#include "runner/checkpoint_store.hpp"
#include "weighting/bases.hpp"
#include "weighting/weights.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// QuestionOutcome — result of processing one question or composite
// ---------------------------------------------------------------------------
struct QuestionOutcome {
    std::string code;
    bool skipped = false;
    std::string skip_reason;
    bool resumed = false;        // taken from a checkpoint, not recomputed
    bool has_table = false;      // false for Open_End and skipped questions
    size_t row_count = 0;
    std::vector<std::string> failed_items;  // ranking items with no data
};

enum class RunStatus { COMPLETE, PARTIAL };

inline const char* run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::COMPLETE: return "COMPLETE";
        case RunStatus::PARTIAL:  return "PARTIAL";
    }
    return "PARTIAL";
}

// ---------------------------------------------------------------------------
// RunReport — tables plus everything the caller needs to judge them
// ---------------------------------------------------------------------------
struct RunReport {
    RunStatus status = RunStatus::COMPLETE;
    BannerStructure structure;
    std::vector<QuestionTable> tables;
    std::vector<QuestionOutcome> outcomes;
    Diagnostics diagnostics;
    bool weighted = false;
    WeightSummary weights;

    std::vector<SkippedQuestion> skipped_questions() const {
        std::vector<SkippedQuestion> out;
        for (const auto& o : outcomes) {
            if (o.skipped) out.push_back({o.code, o.skip_reason});
        }
        return out;
    }

    const QuestionTable* find_table(const std::string& code) const {
        for (const auto& t : tables) {
            if (t.question_code == code) return &t;
        }
        return nullptr;
    }
};

// ---------------------------------------------------------------------------
// CrosstabRunner — sequential batch over the selected questions
//
// Run-level configuration failures (weights, banner, composite definitions)
// throw CrosstabError. Failures inside one question mark it skipped and the
// run continues.
// ---------------------------------------------------------------------------
class CrosstabRunner {
public:
    using ProgressCallback = std::function<void(const QuestionOutcome&)>;

    CrosstabRunner(const CrosstabConfig& config, const SurveyStructure& survey,
                   std::vector<BannerRequest> banner,
                   std::vector<CompositeDefinition> composites = {})
        : config_(config),
          survey_(survey),
          banner_(std::move(banner)),
          composites_(std::move(composites)) {}

    void set_progress_callback(ProgressCallback cb) { progress_ = std::move(cb); }

    RunReport run(const RespondentTable& table, CheckpointStore* store = nullptr) const {
        RunReport report;
        Diagnostics& diag = report.diagnostics;

        WeightSequence weights = weighting::build_weights(table, config_, diag);
        report.weighted = weights.weighted;
        report.weights = weights.summary;
        report.structure = banner::build_structure(survey_, banner_);

        CompositeValidation validation =
            composite::validate_definitions(composites_, survey_, table);
        composite::require_valid(validation);
        for (const auto& w : validation.warnings) diag.warn("composite", w);

        bool checkpointing = store != nullptr && config_.enable_checkpointing;
        Checkpoint progress = checkpointing ? resume(*store, diag) : Checkpoint{};
        std::set<std::string> done(progress.processed.begin(), progress.processed.end());
        report.tables = progress.tables;

        size_t since_save = 0;
        size_t tests_before = diag.skipped_tests().size();
        auto finish = [&](QuestionOutcome outcome, std::optional<QuestionTable> result) {
            if (result.has_value()) {
                outcome.has_table = true;
                outcome.row_count = result->rows.size();
                report.tables.push_back(*result);
                progress.tables.push_back(std::move(*result));
            }
            if (outcome.skipped) progress.skipped.push_back({outcome.code, outcome.skip_reason});
            for (const auto& item : outcome.failed_items) {
                progress.failed_items.push_back({outcome.code, item});
            }
            const auto& tests = diag.skipped_tests();
            for (size_t i = tests_before; i < tests.size(); ++i) {
                progress.skipped_tests.push_back(tests[i]);
            }
            tests_before = tests.size();
            progress.processed.push_back(outcome.code);
            if (progress_) progress_(outcome);
            report.outcomes.push_back(std::move(outcome));

            if (checkpointing && config_.checkpoint_frequency > 0 &&
                ++since_save >= static_cast<size_t>(config_.checkpoint_frequency)) {
                store->save(progress);
                since_save = 0;
            }
        };

        for (const auto& q : survey_.questions()) {
            if (!q.selected) continue;
            if (done.count(q.code)) {
                report.outcomes.push_back(resumed_outcome(q.code, progress));
                continue;
            }
            std::optional<QuestionTable> result;
            QuestionOutcome outcome = run_question(table, q, report.structure, weights, diag, result);
            finish(std::move(outcome), std::move(result));
        }

        if (!composites_.empty()) {
            RowIndexMap all_rows_map;
            std::optional<std::string> map_error;
            try {
                all_rows_map = banner::build_row_index_map(table, table.all_rows(), report.structure);
            } catch (const CrosstabError& e) {
                map_error = e.what();
            }
            for (const auto& def : composites_) {
                if (done.count(def.code)) {
                    report.outcomes.push_back(resumed_outcome(def.code, progress));
                    continue;
                }
                QuestionOutcome outcome;
                outcome.code = def.code;
                std::optional<QuestionTable> result;
                if (map_error.has_value()) {
                    outcome.skipped = true;
                    outcome.skip_reason = *map_error;
                } else {
                    try {
                        result = composite::build_composite_table(table, survey_, def,
                                                                  report.structure, all_rows_map,
                                                                  weights, config_, diag);
                    } catch (const CrosstabError& e) {
                        outcome.skipped = true;
                        outcome.skip_reason = e.what();
                    }
                }
                finish(std::move(outcome), std::move(result));
            }
        }

        if (checkpointing) store->clear();

        bool partial = !diag.skipped_tests().empty();
        for (const auto& o : report.outcomes) {
            partial = partial || o.skipped || !o.failed_items.empty();
        }
        report.status = partial ? RunStatus::PARTIAL : RunStatus::COMPLETE;
        return report;
    }

    // Base filter, segmentation, bases and processor for one question.
    QuestionOutcome run_question(const RespondentTable& table, const QuestionDef& q,
                                 const BannerStructure& structure, const WeightSequence& weights,
                                 Diagnostics& diag, std::optional<QuestionTable>& result) const {
        QuestionOutcome outcome;
        outcome.code = q.code;
        try {
            std::vector<size_t> base_rows =
                filter::apply_base_filter(table, q.base_filter, q.code, diag);
            RowIndexMap index_map = banner::build_row_index_map(table, base_rows, structure);
            std::vector<BaseSize> bases = cells::compute_bases(index_map, weights);
            QuestionContext ctx{table,   survey_, q,       structure, index_map,
                                weights, bases,   config_, diag};
            result = processing::dispatch(ctx, &outcome.failed_items);
            if (!result.has_value()) {
                diag.info("runner", q.code + ": " + variable_type_str(q.type) +
                                        " question produces no table");
            }
        } catch (const CrosstabError& e) {
            outcome.skipped = true;
            outcome.skip_reason = e.what();
            result.reset();
            outcome.failed_items.clear();
        } catch (const std::exception& e) {
            outcome.skipped = true;
            outcome.skip_reason = std::string("processing failed: ") + e.what();
            result.reset();
            outcome.failed_items.clear();
        }
        return outcome;
    }

private:
    // Load the checkpoint; an unreadable one means starting from scratch.
    // Tests omitted before the interruption are carried into this run.
    static Checkpoint resume(CheckpointStore& store, Diagnostics& diag) {
        try {
            std::optional<Checkpoint> loaded = store.load();
            if (!loaded.has_value()) return {};
            diag.info("checkpoint", "resuming after " + std::to_string(loaded->processed.size()) +
                                        " processed questions");
            for (const auto& t : loaded->skipped_tests) {
                diag.skipped_test(t.question, t.scope, t.reason);
            }
            return *loaded;
        } catch (const std::exception& e) {
            diag.info("checkpoint", std::string("checkpoint unreadable, starting fresh: ") +
                                        e.what());
            return {};
        }
    }

    static QuestionOutcome resumed_outcome(const std::string& code, const Checkpoint& progress) {
        QuestionOutcome outcome;
        outcome.code = code;
        outcome.resumed = true;
        for (const auto& s : progress.skipped) {
            if (s.code == code) {
                outcome.skipped = true;
                outcome.skip_reason = s.reason;
            }
        }
        for (const auto& t : progress.tables) {
            if (t.question_code == code) {
                outcome.has_table = true;
                outcome.row_count = t.rows.size();
            }
        }
        for (const auto& f : progress.failed_items) {
            if (f.code == code) outcome.failed_items.push_back(f.item);
        }
        return outcome;
    }

    CrosstabConfig config_;
    SurveyStructure survey_;
    std::vector<BannerRequest> banner_;
    std::vector<CompositeDefinition> composites_;
    ProgressCallback progress_;
};
