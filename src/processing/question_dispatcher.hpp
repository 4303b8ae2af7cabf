#pragma once

#include "cells/question_table.hpp"
#include "processing/numeric_processor.hpp"
#include "processing/question_context.hpp"
#include "processing/standard_processor.hpp"
#include "ranking/ranking_context.hpp"
#include "ranking/ranking_tables.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace processing {

// Route one question to its processor and wrap the rows in a QuestionTable.
// Open_End questions have no table (nullopt). Processors throw CrosstabError
// on failures that make the whole question unusable. Ranking items that could
// not be tabulated are appended to failed_items when given.
inline std::optional<QuestionTable> dispatch(const QuestionContext& ctx,
                                             std::vector<std::string>* failed_items = nullptr) {
    std::vector<QuestionRow> rows;
    switch (ctx.question.type) {
        case VariableType::SINGLE_RESPONSE:
        case VariableType::MULTI_MENTION:
        case VariableType::RATING:
        case VariableType::LIKERT:
        case VariableType::NPS:
            rows = process_standard(ctx);
            break;
        case VariableType::NUMERIC:
            rows = process_numeric(ctx);
            break;
        case VariableType::RANKING: {
            RankingContext rctx(ctx.code(), ctx.diag);
            rows = ranking::process(ctx.table, ctx.survey, ctx.question, ctx.structure,
                                    ctx.index_map, ctx.weights, ctx.cfg, rctx);
            if (failed_items) {
                failed_items->insert(failed_items->end(), rctx.failed_items.begin(),
                                     rctx.failed_items.end());
            }
            break;
        }
        case VariableType::OPEN_END:
            return std::nullopt;
    }

    QuestionTable table;
    table.question_code = ctx.question.code;
    table.question_text = ctx.question.text;
    table.type = ctx.question.type;
    table.base_filter = ctx.question.base_filter;
    table.keys = ctx.structure.keys();
    table.bases = ctx.bases;
    table.rows = std::move(rows);
    return table;
}

}  // namespace processing
