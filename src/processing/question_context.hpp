#pragma once

#include "banner/banner_structure.hpp"
#include "banner/row_index_map.hpp"
#include "config/crosstab_config.hpp"
#include "data/respondent_table.hpp"
#include "data/survey_structure.hpp"
#include "diagnostics.hpp"
#include "significance/sig_letters.hpp"
#include "weighting/bases.hpp"
#include "weighting/weights.hpp"

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// QuestionContext — everything a processor reads for one question
// All members are borrowed; the runner owns them for the question's lifetime.
// ---------------------------------------------------------------------------
struct QuestionContext {
    const RespondentTable& table;
    const SurveyStructure& survey;
    const QuestionDef& question;
    const BannerStructure& structure;
    const RowIndexMap& index_map;
    const WeightSequence& weights;
    const std::vector<BaseSize>& bases;
    const CrosstabConfig& cfg;
    Diagnostics& diag;

    bool is_weighted() const { return weights.weighted; }

    bool testing() const { return cfg.enable_significance_testing; }

    SigSettings sig_settings() const {
        SigSettings s;
        s.alpha = cfg.alpha;
        s.min_base = static_cast<double>(cfg.significance_min_base);
        s.bonferroni = cfg.bonferroni_correction;
        s.is_weighted = weights.weighted;
        return s;
    }

    const std::string& code() const { return question.code; }
};
