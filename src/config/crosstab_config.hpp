#pragma once

#include "diagnostics.hpp"
#include "text_utils.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// WeightRepairPolicy — how invalid design weights are handled
// ---------------------------------------------------------------------------
enum class WeightRepairPolicy { EXCLUDE, COERCE_TO_ONE, ERROR };

inline const char* weight_policy_str(WeightRepairPolicy p) {
    switch (p) {
        case WeightRepairPolicy::EXCLUDE:       return "exclude";
        case WeightRepairPolicy::COERCE_TO_ONE: return "coerce_to_one";
        case WeightRepairPolicy::ERROR:         return "error";
    }
    return "exclude";
}

// ---------------------------------------------------------------------------
// CrosstabConfig — run settings
// ---------------------------------------------------------------------------
struct CrosstabConfig {
    static constexpr double DEFAULT_ALPHA = 0.05;
    static constexpr int DEFAULT_MIN_BASE = 30;
    static constexpr int CHECKPOINT_FREQUENCY = 10;

    // Weighting
    bool apply_weighting = false;
    std::string weight_variable;
    WeightRepairPolicy weight_policy = WeightRepairPolicy::EXCLUDE;

    // Row selection
    bool show_frequency = true;
    bool show_percent_column = true;
    bool show_percent_row = false;
    bool show_unweighted_n = true;
    bool show_effective_n = true;
    bool boxcategory_frequency = false;
    bool boxcategory_percent_column = true;
    bool boxcategory_percent_row = false;
    bool show_standard_deviation = false;
    bool show_net_positive = false;
    bool show_numeric_median = false;
    bool show_numeric_mode = false;
    bool show_numeric_outliers = false;
    bool exclude_outliers_from_stats = false;
    bool zero_division_as_blank = true;

    // Formatting
    int decimal_places_percent = 0;
    int decimal_places_ratings = 1;
    int decimal_places_index = 1;
    int decimal_places_numeric = 1;

    // Significance
    bool enable_significance_testing = true;
    double alpha = DEFAULT_ALPHA;
    int significance_min_base = DEFAULT_MIN_BASE;
    bool bonferroni_correction = true;
    bool enable_chi_square = false;

    // Ranking
    bool ranking_show_top_n = true;
    int ranking_top_n = 3;
    double ranking_tie_threshold_pct = 5.0;
    double ranking_gap_threshold_pct = 5.0;
    double ranking_completeness_threshold_pct = 80.0;

    // Checkpointing
    bool enable_checkpointing = true;
    int checkpoint_frequency = CHECKPOINT_FREQUENCY;

    bool is_weighted() const { return apply_weighting && !weight_variable.empty(); }
};

namespace config_io {

inline CrosstabError invalid_setting(const std::string& key, const std::string& value,
                                     const std::string& expected) {
    return CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Invalid Setting",
                         "Setting '" + key + "' has value '" + value + "'",
                         "The run cannot be configured reliably.",
                         "Expected " + expected + ".");
}

inline bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = text_utils::to_lower(text_utils::trim(value));
    if (v == "y" || v == "yes" || v == "true" || v == "1") return true;
    if (v == "n" || v == "no" || v == "false" || v == "0") return false;
    throw invalid_setting(key, value, "Y/N or TRUE/FALSE");
}

inline double parse_double(const std::string& key, const std::string& value) {
    auto v = text_utils::parse_number(value);
    if (!v.has_value()) throw invalid_setting(key, value, "a number");
    return *v;
}

inline int parse_int(const std::string& key, const std::string& value) {
    double v = parse_double(key, value);
    if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw invalid_setting(key, value, "a whole number in integer range");
    }
    if (v != std::trunc(v)) {
        throw invalid_setting(key, value, "a whole number");
    }
    return static_cast<int>(v);
}

inline WeightRepairPolicy parse_weight_policy(const std::string& value) {
    std::string v = text_utils::to_lower(text_utils::trim(value));
    if (v == "exclude") return WeightRepairPolicy::EXCLUDE;
    if (v == "coerce_to_one") return WeightRepairPolicy::COERCE_TO_ONE;
    if (v == "error") return WeightRepairPolicy::ERROR;
    throw invalid_setting("weight_policy", value, "exclude, coerce_to_one or error");
}

// Apply one key=value setting. Unknown keys are configuration errors.
inline void apply_setting(CrosstabConfig& cfg, const std::string& raw_key,
                          const std::string& value) {
    std::string key = text_utils::to_lower(text_utils::trim(raw_key));

    std::map<std::string, bool*> bools = {
        {"apply_weighting", &cfg.apply_weighting},
        {"show_frequency", &cfg.show_frequency},
        {"show_percent_column", &cfg.show_percent_column},
        {"show_percent_row", &cfg.show_percent_row},
        {"show_unweighted_n", &cfg.show_unweighted_n},
        {"show_effective_n", &cfg.show_effective_n},
        {"boxcategory_frequency", &cfg.boxcategory_frequency},
        {"boxcategory_percent_column", &cfg.boxcategory_percent_column},
        {"boxcategory_percent_row", &cfg.boxcategory_percent_row},
        {"show_standard_deviation", &cfg.show_standard_deviation},
        {"show_net_positive", &cfg.show_net_positive},
        {"show_numeric_median", &cfg.show_numeric_median},
        {"show_numeric_mode", &cfg.show_numeric_mode},
        {"show_numeric_outliers", &cfg.show_numeric_outliers},
        {"exclude_outliers_from_stats", &cfg.exclude_outliers_from_stats},
        {"zero_division_as_blank", &cfg.zero_division_as_blank},
        {"enable_significance_testing", &cfg.enable_significance_testing},
        {"bonferroni_correction", &cfg.bonferroni_correction},
        {"enable_chi_square", &cfg.enable_chi_square},
        {"ranking_show_top_n", &cfg.ranking_show_top_n},
        {"enable_checkpointing", &cfg.enable_checkpointing},
    };
    std::map<std::string, int*> ints = {
        {"decimal_places_percent", &cfg.decimal_places_percent},
        {"decimal_places_ratings", &cfg.decimal_places_ratings},
        {"decimal_places_index", &cfg.decimal_places_index},
        {"decimal_places_numeric", &cfg.decimal_places_numeric},
        {"significance_min_base", &cfg.significance_min_base},
        {"ranking_top_n", &cfg.ranking_top_n},
        {"checkpoint_frequency", &cfg.checkpoint_frequency},
    };
    std::map<std::string, double*> doubles = {
        {"alpha", &cfg.alpha},
        {"ranking_tie_threshold_pct", &cfg.ranking_tie_threshold_pct},
        {"ranking_gap_threshold_pct", &cfg.ranking_gap_threshold_pct},
        {"ranking_completeness_threshold_pct", &cfg.ranking_completeness_threshold_pct},
    };

    if (auto it = bools.find(key); it != bools.end()) {
        *it->second = parse_bool(key, value);
        return;
    }
    if (auto it = ints.find(key); it != ints.end()) {
        *it->second = parse_int(key, value);
        if (*it->second < 0) throw invalid_setting(key, value, "a non-negative number");
        return;
    }
    if (auto it = doubles.find(key); it != doubles.end()) {
        double v = parse_double(key, value);
        if (key == "alpha" && (v <= 0.0 || v >= 1.0)) {
            throw invalid_setting(key, value, "a value in (0, 1)");
        }
        *it->second = v;
        return;
    }
    if (key == "weight_variable") {
        cfg.weight_variable = text_utils::trim(value);
        return;
    }
    if (key == "weight_policy") {
        cfg.weight_policy = parse_weight_policy(value);
        return;
    }
    throw CrosstabError(ErrorCode::CFG_INVALID_VALUE, "Unknown Setting",
                        "Setting '" + raw_key + "' is not recognised",
                        "A misspelt setting would silently fall back to its default.",
                        "Check the setting name.");
}

// Apply a "key=value" string (CLI --set form).
inline void apply_assignment(CrosstabConfig& cfg, const std::string& assignment) {
    size_t eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw invalid_setting(assignment, "", "key=value");
    }
    apply_setting(cfg, assignment.substr(0, eq), assignment.substr(eq + 1));
}

// Read "key = value" lines; '#' starts a comment, blank lines are ignored.
inline CrosstabConfig load_settings_file(const std::string& path,
                                         CrosstabConfig cfg = CrosstabConfig{}) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw CrosstabError(ErrorCode::DATA_LOAD_FAILED, "Settings File Not Readable",
                            "Cannot open settings file: " + path, "",
                            "Check the --config path.");
    }
    std::string line;
    while (std::getline(in, line)) {
        size_t hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        if (text_utils::trim(line).empty()) continue;
        apply_assignment(cfg, line);
    }
    return cfg;
}

}  // namespace config_io
