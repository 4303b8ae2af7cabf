#pragma once

#include "banner/banner_structure.hpp"
#include "cells/question_table.hpp"
#include "diagnostics.hpp"
#include "significance/multiple_comparison.hpp"
#include "significance/pairwise_tests.hpp"
#include "weighting/bases.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// SigSettings — significance parameters for one table
// ---------------------------------------------------------------------------
struct SigSettings {
    double alpha = 0.05;
    double min_base = 30.0;
    bool bonferroni = true;
    bool is_weighted = false;
};

// Which direction earns a letter.
enum class SigDirection { HIGHER_IS_BETTER, LOWER_IS_BETTER };

namespace significance {

// Run every ordered pair (i, j) inside each banner group through `compare`
// (signature: TestResult(size_t i, size_t j, double alpha)) and give column i
// the letter of every j it beats. Total is marked "-". The row is labelled
// with `scope`, the label of the row it tests. Pairs that could not be
// tested are reported once per row to `diag`.
template <typename Compare>
QuestionRow letters_row(const BannerStructure& structure, Compare compare,
                        const SigSettings& settings, SigDirection direction,
                        const std::string& question, const std::string& scope,
                        Diagnostics& diag) {
    QuestionRow row;
    row.label = scope;
    row.kind = RowKind::SIG;
    row.cells.assign(structure.size(), std::string());
    row.cells[BannerStructure::TOTAL_INDEX] = std::string("-");

    size_t tested = 0, skipped = 0;
    std::map<std::string, size_t> reasons;

    for (const auto& group : structure.groups()) {
        const auto& cols = group.columns;
        double alpha_adj = bonferroni_alpha(settings.alpha, cols.size(), settings.bonferroni);

        for (size_t a = 0; a < cols.size(); ++a) {
            std::string letters;
            for (size_t b = 0; b < cols.size(); ++b) {
                if (a == b) continue;
                TestResult res = compare(cols[a], cols[b], alpha_adj);
                if (a < b) {
                    if (res.skipped) {
                        ++skipped;
                        ++reasons[res.skip_reason];
                    } else {
                        ++tested;
                    }
                }
                if (res.skipped || !res.significant) continue;
                bool wins = direction == SigDirection::HIGHER_IS_BETTER ? res.higher : !res.higher;
                if (wins) letters += structure.columns()[cols[b]].letter;
            }
            row.cells[cols[a]] = letters;
        }
    }

    if (skipped > 0) {
        std::string why;
        for (const auto& [reason, n] : reasons) {
            if (!why.empty()) why += "; ";
            why += reason + " (" + std::to_string(n) + ")";
        }
        diag.skipped_test(question, scope,
                          std::to_string(skipped) + " of " + std::to_string(skipped + tested) +
                              " pairwise tests skipped: " + why);
    }
    return row;
}

// Proportion letters from weighted counts and the segment bases.
inline QuestionRow proportion_letters(const BannerStructure& structure,
                                      const std::vector<double>& counts,
                                      const std::vector<BaseSize>& bases,
                                      const SigSettings& settings,
                                      const std::string& question, const std::string& scope,
                                      Diagnostics& diag,
                                      SigDirection direction = SigDirection::HIGHER_IS_BETTER) {
    auto sample = [&](size_t c) {
        ProportionSample s;
        s.count = counts[c];
        s.base = bases[c].percent_base(settings.is_weighted);
        s.eff_n = bases[c].test_n(settings.is_weighted);
        return s;
    };
    auto compare = [&](size_t i, size_t j, double alpha) {
        return z_test_proportions(sample(i), sample(j), settings.is_weighted,
                                  settings.min_base, alpha);
    };
    return letters_row(structure, compare, settings, direction, question, scope, diag);
}

// Mean letters from per-segment samples; a missing sample is untestable.
inline QuestionRow mean_letters(const BannerStructure& structure,
                                const std::vector<std::optional<MeanSample>>& samples,
                                const SigSettings& settings,
                                const std::string& question, const std::string& scope,
                                Diagnostics& diag,
                                SigDirection direction = SigDirection::HIGHER_IS_BETTER) {
    auto compare = [&](size_t i, size_t j, double alpha) {
        if (!samples[i].has_value() || !samples[j].has_value()) {
            TestResult res{};
            res.skipped = true;
            res.skip_reason = "no valid values";
            return res;
        }
        return t_test_means(*samples[i], *samples[j], settings.min_base, alpha);
    };
    return letters_row(structure, compare, settings, direction, question, scope, diag);
}

}  // namespace significance
